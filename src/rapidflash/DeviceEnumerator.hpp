#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <core/common.hpp>


namespace rapidflash
{
struct DeviceInfo
{
    /** Path to open for writing, e.g., /dev/sdb. */
    std::string path;
    std::string displayName;
    std::string humanSize;
    /** "Removable", "USB", or "Internal". */
    std::string category;
    uint64_t sizeInBytes{ 0 };
};


inline std::ostream&
operator<<( std::ostream&     out,
            const DeviceInfo& device )
{
    out << device.path << " (" << device.displayName << ", " << device.humanSize << ", " << device.category << ")";
    return out;
}


/**
 * Lists candidate flash destinations. Only used by the command line front-end.
 */
class DeviceEnumerator
{
public:
    virtual
    ~DeviceEnumerator() = default;

    [[nodiscard]] virtual std::vector<DeviceInfo>
    enumerate() const = 0;
};


/**
 * Lists the block devices in /sys/block. Virtual devices, i.e., loop devices, RAM disks, and device-mapper
 * targets, as well as devices without medium, are left out.
 */
class SysfsDeviceEnumerator :
    public DeviceEnumerator
{
public:
    explicit
    SysfsDeviceEnumerator( std::filesystem::path sysBlockPath = "/sys/block",
                           std::filesystem::path devPath = "/dev" ) :
        m_sysBlockPath( std::move( sysBlockPath ) ),
        m_devPath( std::move( devPath ) )
    {}

    [[nodiscard]] std::vector<DeviceInfo>
    enumerate() const override
    {
        std::vector<DeviceInfo> devices;

        std::error_code errorCode;
        std::filesystem::directory_iterator entries( m_sysBlockPath, errorCode );
        if ( errorCode ) {
            std::cerr << "[Warning] Could not list block devices in " << m_sysBlockPath << ": "
                      << errorCode.message() << "\n";
            return devices;
        }

        for ( const auto& entry : entries ) {
            const auto name = entry.path().filename().string();
            if ( isVirtualDevice( name ) ) {
                continue;
            }

            const auto sectorCount = readNumber( entry.path() / "size" );
            if ( !sectorCount || ( *sectorCount == 0 ) ) {
                continue;
            }

            DeviceInfo device;
            device.path = ( m_devPath / name ).string();
            device.sizeInBytes = *sectorCount * 512U;
            device.humanSize = formatBytes( device.sizeInBytes );
            device.displayName = determineDisplayName( entry.path(), name );
            device.category = determineCategory( entry.path() );
            devices.emplace_back( std::move( device ) );
        }

        std::sort( devices.begin(), devices.end(),
                   [] ( const auto& a, const auto& b ) { return a.path < b.path; } );
        return devices;
    }

private:
    [[nodiscard]] static bool
    isVirtualDevice( const std::string& name )
    {
        using namespace std::string_view_literals;
        return startsWith( name, "loop"sv ) || startsWith( name, "ram"sv ) || startsWith( name, "zram"sv )
               || startsWith( name, "dm-"sv );
    }

    [[nodiscard]] static std::string
    readLine( const std::filesystem::path& path )
    {
        std::ifstream file( path );
        std::string line;
        std::getline( file, line );

        const auto isSpace = [] ( unsigned char c ) { return std::isspace( c ) != 0; };
        line.erase( std::find_if_not( line.rbegin(), line.rend(), isSpace ).base(), line.end() );
        line.erase( line.begin(), std::find_if_not( line.begin(), line.end(), isSpace ) );
        return line;
    }

    [[nodiscard]] static std::optional<uint64_t>
    readNumber( const std::filesystem::path& path )
    {
        const auto line = readLine( path );
        if ( line.empty() || !std::all_of( line.begin(), line.end(),
                                            [] ( unsigned char c ) { return std::isdigit( c ) != 0; } ) ) {
            return std::nullopt;
        }
        try {
            return std::stoull( line );
        } catch ( const std::out_of_range& ) {
            return std::nullopt;
        }
    }

    [[nodiscard]] static std::string
    determineDisplayName( const std::filesystem::path& devicePath,
                          const std::string&           name )
    {
        const auto vendor = readLine( devicePath / "device" / "vendor" );
        const auto model = readLine( devicePath / "device" / "model" );
        if ( vendor.empty() && model.empty() ) {
            return name;
        }
        if ( vendor.empty() || model.empty() ) {
            return vendor + model;
        }
        return vendor + " " + model;
    }

    [[nodiscard]] static std::string
    determineCategory( const std::filesystem::path& devicePath )
    {
        if ( readNumber( devicePath / "removable" ) == std::optional<uint64_t>( 1 ) ) {
            return "Removable";
        }

        /* Entries in /sys/block are symbolic links into the device tree, which shows the bus. */
        std::error_code errorCode;
        const auto resolvedPath = std::filesystem::canonical( devicePath, errorCode );
        if ( !errorCode && ( resolvedPath.string().find( "/usb" ) != std::string::npos ) ) {
            return "USB";
        }
        return "Internal";
    }

private:
    const std::filesystem::path m_sysBlockPath;
    const std::filesystem::path m_devPath;
};
}  // namespace rapidflash
