// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <string>

#include <unistd.h>

namespace elastic {
namespace log {
class Record;
}

// A Unix error code from errno.
class UnixError {
public:
	explicit UnixError(int errorCode);
	void AddToRecord(log::Record &record) const;

	static UnixError Get();

private:
	int mError;
	std::string mText;
};

// Closes a file descriptor when it goes out of scope.
class FileCloser {
public:
	explicit FileCloser(int fd) : mFile{fd} {}
	FileCloser(const FileCloser &) = delete;
	FileCloser &operator=(const FileCloser &) = delete;
	~FileCloser() { ::close(mFile); }

private:
	int mFile;
};

} // namespace elastic
