// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "text_buffer.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <new>

namespace elastic {

namespace {

// Return the next larger capacity for the buffer. (GrowSize(x)-x) is
// monotonic.
constexpr std::size_t GrowSize(std::size_t size) {
	return (size + 16) * 3 / 2;
}

const char HexDigit[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                           '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

// Return the escape letter for an ASCII character, 'x' for a hex escape, or 0
// if the character is written as-is.
char EscapeFor(unsigned char ch) {
	switch (ch) {
	case '\t':
		return 't';
	case '\n':
		return 'n';
	case '\r':
		return 'r';
	case '"':
		return '"';
	case '\\':
		return '\\';
	default:
		return ch < 32 || ch == 127 ? 'x' : 0;
	}
}

template <typename T>
char *ToChars(char *first, char *last, T value) {
	std::to_chars_result result = std::to_chars(first, last, value);
	return result.ec == std::errc{} ? result.ptr : nullptr;
}

} // namespace

TextBuffer::~TextBuffer() {
	if (mIsDynamic) {
		std::free(mStart);
	}
}

void TextBuffer::Append(const char *str, std::size_t count) {
	if (count == 0) {
		return;
	}
	Reserve(count);
	std::memcpy(mPos, str, count);
	mPos += count;
}

void TextBuffer::AppendQuoted(std::string_view str) {
	AppendChar('"');
	AppendEscaped(str);
	AppendChar('"');
}

void TextBuffer::AppendEscaped(std::string_view str) {
	constexpr std::size_t MinSpace = 4;
	static_assert(GrowSize(0) >= MinSpace, "Wrong growth curve.");

	for (const char c : str) {
		if (Avail() < MinSpace) {
			Grow();
		}
		const unsigned char ch = static_cast<unsigned char>(c);
		const char escape = ch < 128 ? EscapeFor(ch) : 0;
		if (escape == 0) {
			*mPos++ = c;
		} else if (escape == 'x') {
			mPos[0] = '\\';
			mPos[1] = 'x';
			mPos[2] = HexDigit[ch >> 4];
			mPos[3] = HexDigit[ch & 15];
			mPos += 4;
		} else {
			mPos[0] = '\\';
			mPos[1] = escape;
			mPos += 2;
		}
	}
}

void TextBuffer::AppendNumber(long long value) {
	AppendFunction([value](char *first, char *last) {
		return ToChars(first, last, value);
	});
}

void TextBuffer::AppendNumber(unsigned long long value) {
	AppendFunction([value](char *first, char *last) {
		return ToChars(first, last, value);
	});
}

void TextBuffer::AppendNumber(float value) {
	AppendFunction([value](char *first, char *last) {
		return ToChars(first, last, value);
	});
}

void TextBuffer::AppendNumber(double value) {
	AppendFunction([value](char *first, char *last) {
		return ToChars(first, last, value);
	});
}

void TextBuffer::AppendBool(bool value) {
	if (value) {
		Append("true", 4);
	} else {
		Append("false", 5);
	}
}

void TextBuffer::Grow() {
	Reallocate(GrowSize(mEnd - mStart));
}

void TextBuffer::Reserve(std::size_t size) {
	const std::size_t capacity = mEnd - mStart;
	const std::size_t minimum = (mPos - mStart) + size;
	if (capacity < minimum) {
		const std::size_t nextLarger = GrowSize(capacity);
		Reallocate(nextLarger >= minimum ? nextLarger : minimum);
	}
}

void TextBuffer::Reallocate(std::size_t newCapacity) {
	const std::ptrdiff_t offset = mPos - mStart;
	char *ptr;
	if (mIsDynamic) {
		ptr = static_cast<char *>(std::realloc(mStart, newCapacity));
	} else {
		ptr = static_cast<char *>(std::malloc(newCapacity));
		if (ptr != nullptr && offset > 0) {
			std::memcpy(ptr, mStart, offset);
		}
	}
	if (ptr == nullptr) {
		throw std::bad_alloc();
	}
	mStart = ptr;
	mPos = ptr + offset;
	mEnd = ptr + newCapacity;
	mIsDynamic = true;
}

} // namespace elastic
