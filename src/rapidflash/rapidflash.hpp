#pragma once

#include "DecodingReader.hpp"
#include "DeviceEnumerator.hpp"
#include "format.hpp"
#include "ImageFlasher.hpp"
#include "PartitionTable.hpp"
#include "ProgressTracker.hpp"
#include "SizeResolver.hpp"
#include "SparseMultiWriter.hpp"
#include "SyncScheduler.hpp"
