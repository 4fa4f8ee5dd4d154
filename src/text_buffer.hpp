// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <concepts>
#include <cstddef>
#include <cstring>
#include <string_view>
#include <type_traits>

namespace elastic {

// Text buffer for building log lines. Starts in caller-provided storage and
// moves to the heap if a line does not fit.
class TextBuffer {
public:
	TextBuffer()
		: mStart{nullptr}, mPos{nullptr}, mEnd{nullptr}, mIsDynamic{false} {}

	template <std::size_t N>
	explicit TextBuffer(char (&arr)[N])
		: mStart{arr}, mPos{arr}, mEnd{arr + N}, mIsDynamic{false} {}

	~TextBuffer();

	TextBuffer(const TextBuffer &) = delete;
	TextBuffer &operator=(const TextBuffer &) = delete;

	const char *Start() const { return mStart; }
	std::size_t Size() const { return mPos - mStart; }
	std::size_t Avail() const { return mEnd - mPos; }
	std::string_view Contents() const {
		return std::string_view(mStart, mPos - mStart);
	}

	// Append a single character.
	void AppendChar(char c) {
		if (mPos == mEnd) {
			Grow();
		}
		*mPos++ = c;
	}

	// Append a string.
	void Append(const char *str, std::size_t count);
	void Append(const char *str) { Append(str, std::strlen(str)); }
	void Append(std::string_view value) { Append(value.data(), value.size()); }

	// Append a string, enclosed in quotes, with characters escaped.
	void AppendQuoted(std::string_view str);

	// Append a string with quotes, backslashes and control characters
	// escaped. Bytes outside ASCII are copied unchanged.
	void AppendEscaped(std::string_view str);

	void AppendNumber(long long value);
	void AppendNumber(unsigned long long value);
	void AppendNumber(float value);
	void AppendNumber(double value);

	template <std::signed_integral Integer>
		requires(!std::is_same_v<Integer, long long>)
	void AppendNumber(Integer value) {
		AppendNumber(static_cast<long long>(value));
	}

	template <std::unsigned_integral Integer>
		requires(!std::is_same_v<Integer, unsigned long long> &&
	             !std::is_same_v<Integer, bool>)
	void AppendNumber(Integer value) {
		AppendNumber(static_cast<unsigned long long>(value));
	}

	void AppendBool(bool value);

	// Append using a function. The function is called with larger and larger
	// buffer sizes until it succeeds. The function should return nullptr if it
	// fails, or a pointer past the last character written if it succeeds.
	template <std::invocable<char *, char *> Function>
	void AppendFunction(Function f) {
		if (Avail() == 0) {
			Grow();
		}
		for (;;) {
			char *pos = f(mPos, mEnd);
			if (pos != nullptr) {
				mPos = pos;
				return;
			}
			Grow();
		}
	}

	// Clear the text buffer, but do not release storage.
	void Clear() { mPos = mStart; }

	// Increase the amount of available space to write.
	void Grow();

	// Reserve space for writing the given number of characters.
	void Reserve(std::size_t size);

private:
	void Reallocate(std::size_t newCapacity);

	char *mStart;
	char *mPos;
	char *mEnd;
	bool mIsDynamic;
};

} // namespace elastic
