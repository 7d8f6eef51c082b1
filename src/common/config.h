#pragma once

#include <cstddef>
#include <cstdint>

/// Merge engine defaults
/// Capacity of the hand-off queue between concurrent workers and the writer (records)
const size_t kDefaultHandOffQueueCapacity = 4096;
/// Number of workers used by the concurrent mode when nothing else is configured
const int kDefaultWorkerCount = 4;
/// Upper bounds accepted by Configuration::validate()
const size_t kMaxHandOffQueueCapacity = 1 << 24;
const int kMaxWorkerCount = 1024;
const int64_t kMaxPollIntervalMs = 60 * 1000;
/// How long a blocked worker or the writer waits before re-checking cancellation
const int64_t kDefaultPollIntervalMs = 20;

/// IO defaults
/// Read buffer of a line reader
const size_t kDefaultReadBufferKb = 64;
const size_t kMaxReadBufferKb = 64 * 1024;
/// zlib compression level for gzip destinations
const int kDefaultGzipLevel = 6;

/// Leading timestamp layout understood by LayoutTimeHandler (strptime syntax)
constexpr char kDefaultTimeLayout[] = "%Y/%m/%d %H:%M:%S";
