// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "text_buffer.hpp"

#include <cstddef>

namespace elastic {
namespace log {

class Record;

// Local buffer size for constructing log messages.
constexpr std::size_t LogBufferSize = 256;

// Options for formatting a log line.
struct LineFormat {
	bool useColor; // Wrap the level name in terminal escape sequences.
	bool useEmoji; // Prefix the line with an emoji for the level.
};

// Write a record as a single line.
void WriteLine(TextBuffer &buffer, const Record &record, LineFormat format);

// Sink for writing log messages to standard error.
class UnixWriter {
public:
	// Initialize the log destination. Return true if logging is available.
	static bool Init();

	UnixWriter() : mBuffer{mBufferData} {}

	// Write a record to the log.
	void Log(const Record &record);

	// Fail the program with a given error message.
	[[noreturn]]
	void Fail(const Record &record);

private:
	TextBuffer mBuffer;
	char mBufferData[LogBufferSize];
};

using Writer = UnixWriter;

} // namespace log
} // namespace elastic
