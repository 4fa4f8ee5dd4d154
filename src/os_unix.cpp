// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "os_unix.hpp"

#include "log.hpp"

#include <cstring>

#include <errno.h>

namespace elastic {

namespace {

// The XSI strerror_r returns a status code and fills the buffer. The GNU
// strerror_r returns the message, which may not be the buffer.
[[maybe_unused]] const char *ErrorMessage(int result, const char *buffer) {
	return result == 0 ? buffer : "";
}

[[maybe_unused]] const char *ErrorMessage(const char *result, const char *) {
	return result;
}

std::string GetErrorText(int errorCode) {
	char buffer[256];
	buffer[0] = '\0';
	return ErrorMessage(strerror_r(errorCode, buffer, sizeof(buffer)), buffer);
}

} // namespace

UnixError::UnixError(int errorCode)
	: mError{errorCode}, mText{GetErrorText(errorCode)} {}

void UnixError::AddToRecord(log::Record &record) const {
	if (mError != 0) {
		record.Add("error", mError);
		if (!mText.empty()) {
			record.Add("description", mText);
		}
	}
}

UnixError UnixError::Get() {
	return UnixError{errno};
}

} // namespace elastic
