// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "log.hpp"

#include "log_internal.hpp"
#include "text_buffer.hpp"

#include <string_view>

namespace elastic {
namespace log {

const Location Location::Zero{};

namespace {

bool HasLog;

struct LevelInfo {
	std::string_view color;
	std::string_view name;
	std::string_view emoji;
};

// These names all have the same width so log messages line up.
const LevelInfo Levels[] = {
	{"\x1b[36m", "DEBUG", "📘"},
	{"", "INFO ", "📄"},
	{"\x1b[33m", "WARN ", "⚠️"},
	{"\x1b[31m", "ERROR", "🛑"},
};

const LevelInfo &GetLevelInfo(Level level) {
	return Levels[static_cast<int>(level)];
}

// Return true if the string should be quoted when logged.
bool DoesNeedQuotes(std::string_view str) {
	if (str.empty()) {
		return true;
	}
	for (const char c : str) {
		const unsigned char ch = static_cast<unsigned char>(c);
		if (ch <= 32 || ch == 127 || ch == '"' || ch == '\\') {
			return true;
		}
	}
	return false;
}

void AppendFileName(TextBuffer &out, std::string_view file) {
	// NOTE: We rely on this file being named ${prefix}src/log.cpp so we can
	// figure out what the prefix is for other files.
	constexpr std::string_view thisFile = __FILE__;
	constexpr std::string_view prefix =
		thisFile.substr(0, thisFile.size() - 11);
	if (file.size() < prefix.size() ||
	    file.substr(0, prefix.size()) != prefix) {
		out.Append(file);
		return;
	}
	out.Append(file.substr(prefix.size()));
}

void AppendLocation(TextBuffer &out, const Location &location) {
	AppendFileName(out, location.file);
	out.AppendChar(':');
	out.AppendNumber(location.line);
	out.Append(" (");
	out.Append(location.function);
	out.AppendChar(')');
}

void AppendValue(TextBuffer &out, const Value &value) {
	switch (value.ValueKind()) {
	case Kind::Null:
		out.Append("(null)");
		break;
	case Kind::Int:
		out.AppendNumber(value.IntValue());
		break;
	case Kind::Uint:
		out.AppendNumber(value.UintValue());
		break;
	case Kind::Float:
		out.AppendNumber(value.FloatValue());
		break;
	case Kind::Bool:
		out.AppendBool(value.BoolValue());
		break;
	case Kind::String: {
		std::string_view str = value.StringValue();
		if (DoesNeedQuotes(str)) {
			out.AppendQuoted(str);
		} else {
			out.Append(str);
		}
	} break;
	case Kind::Vector: {
		// Written as (x,y,z) so the value stays a single token.
		out.AppendChar('(');
		bool first = true;
		for (const float component : value.VectorValue()) {
			if (!first) {
				out.AppendChar(',');
			}
			first = false;
			out.AppendNumber(component);
		}
		out.AppendChar(')');
	} break;
	}
}

} // namespace

void WriteLine(TextBuffer &buffer, const Record &record, LineFormat format) {
	const LevelInfo &levelInfo = GetLevelInfo(record.level());
	const bool useColor = format.useColor && !levelInfo.color.empty();
	if (format.useEmoji) {
		buffer.Append(levelInfo.emoji);
		buffer.AppendChar(' ');
	}
	if (useColor) {
		buffer.Append(levelInfo.color);
	}
	buffer.Append(levelInfo.name);
	if (useColor) {
		buffer.Append("\x1b[0m");
	}
	buffer.AppendChar(' ');
	if (!record.location().is_empty()) {
		AppendLocation(buffer, record.location());
		buffer.Append(": ");
	}
	buffer.Append(record.message());
	for (const Attr &attr : record.attributes()) {
		buffer.AppendChar(' ');
		buffer.Append(attr.name());
		buffer.AppendChar('=');
		AppendValue(buffer, attr.value());
	}
	buffer.AppendChar('\n');
}

void Init() {
	HasLog = Writer::Init();
}

void Record::Log() const {
	if (!HasLog) {
		return;
	}

	Writer writer;
	writer.Log(*this);
}

[[noreturn]]
void Record::Fail() const {
	Writer writer;
	writer.Fail(*this);
}

} // namespace log
} // namespace elastic
