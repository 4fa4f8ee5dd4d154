// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "log_internal.hpp"

#include "log.hpp"
#include "main.hpp"

#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace elastic {
namespace log {

namespace {

// Return true if the output should be colorized using terminal escape
// sequences.
bool ShouldEnableColor() {
	// If $NO_COLOR is non-empty, no color.
	const char *noColor = std::getenv("NO_COLOR");
	if (noColor != nullptr && *noColor != '\0') {
		return false;
	}

	// If stderr is not a tty, no color.
	if (isatty(STDERR_FILENO) == 0) {
		return false;
	}

	// TERM=dumb is used by editors that capture output.
	const char *term = std::getenv("TERM");
	if (term == nullptr || std::strcmp(term, "dumb") == 0) {
		return false;
	}
	return true;
}

LineFormat Format;

// Write the whole buffer to stderr. Errors are ignored, there is nowhere left
// to report them.
void WriteStderr(const TextBuffer &buffer) {
	const char *ptr = buffer.Start();
	std::size_t remaining = buffer.Size();
	while (remaining > 0) {
		const ssize_t amt = ::write(STDERR_FILENO, ptr, remaining);
		if (amt <= 0) {
			return;
		}
		ptr += amt;
		remaining -= static_cast<std::size_t>(amt);
	}
}

} // namespace

bool UnixWriter::Init() {
	const bool color = ShouldEnableColor();
	Format = LineFormat{color, color};
	return true;
}

void UnixWriter::Log(const Record &record) {
	mBuffer.Clear();
	WriteLine(mBuffer, record, Format);
	WriteStderr(mBuffer);
}

[[noreturn]]
void UnixWriter::Fail(const Record &record) {
	mBuffer.Clear();
	WriteLine(mBuffer, record, Format);
	if (Format.useColor) {
		mBuffer.Append("\x1b[31m");
	}
	mBuffer.Append("===== Fatal Error =====");
	if (Format.useColor) {
		mBuffer.Append("\x1b[0m");
	}
	mBuffer.AppendChar('\n');
	WriteStderr(mBuffer);
	ExitError();
}

} // namespace log
} // namespace elastic
