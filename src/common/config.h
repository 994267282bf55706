#pragma once

#include <cstdint>

/// Data file configs
/// The file read at startup and overwritten at the end of a run
constexpr char kDefaultDataPath[] = "resources/protagonists.csv";
/// Field separator of the data file
constexpr char kFieldDelimiter = ',';
/// Separator written between output lines (no trailing one)
constexpr char kLineDelimiter = '\n';

/// Prompt configs
constexpr char kDefaultPrompt[] = "By how much should I update the age? ";
/// Printed in lenient mode when the answer is not a number
constexpr char kInvalidInputNotice[] = "Invalid input";

/// Run configs
/// Providers run in parallel, so the pool needs at least two workers.
const int64_t kMinWorkerThreads = 2;
const int64_t kDefaultWorkerThreads = 2;
/// 0 means wait for the joined inputs without bound.
const int64_t kDefaultTimeoutMs = 0;
/// How long the conversation lingers after GoodBye before shutting down.
const int64_t kDefaultShutdownDelayMs = 2000;
