// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "os_file.hpp"

#include "log.hpp"
#include "os_unix.hpp"
#include "var.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace elastic {

namespace {

// Limit on maximum file size when reading files into memory. Shaders are a
// few kilobytes.
constexpr std::size_t MaxFileSize = 16 * 1024 * 1024;

} // namespace

void AppendPath(std::string *path, std::string_view relativePath) {
	CHECK(!relativePath.empty() && relativePath.front() != '/');
	if (path->empty()) {
		FAIL("Path is empty.");
	}
	if (path->back() != '/') {
		path->push_back('/');
	}
	path->append(relativePath);
}

bool ReadFile(std::string *data, const std::string &path) {
	const int fd = ::open(path.c_str(), O_RDONLY);
	if (fd == -1) {
		LOG(Error, "Could not open file.", log::Attr{"file", path},
		    UnixError::Get());
		return false;
	}
	FileCloser closer{fd};
	struct stat st;
	if (::fstat(fd, &st) != 0) {
		LOG(Error, "Could not get file information.", log::Attr{"file", path},
		    UnixError::Get());
		return false;
	}
	const off_t osize = st.st_size;
	if (osize > static_cast<off_t>(MaxFileSize)) {
		LOG(Error, "File is too large.", log::Attr{"file", path},
		    log::Attr{"size", static_cast<long long>(osize)},
		    log::Attr{"maxSize", MaxFileSize});
		return false;
	}
	const std::size_t size = static_cast<std::size_t>(osize);
	data->resize(size);
	for (std::size_t pos = 0; pos < size;) {
		const ssize_t amt = ::read(fd, data->data() + pos, size - pos);
		if (amt < 0) {
			LOG(Error, "Could not read file.", log::Attr{"file", path},
			    UnixError::Get());
			return false;
		}
		if (amt == 0) {
			LOG(Error, "File changed while reading.", log::Attr{"file", path});
			return false;
		}
		pos += static_cast<std::size_t>(amt);
	}
	return true;
}

bool ReadProjectFile(std::string *data, std::string_view relativePath) {
	if (var::ProjectPath.get().empty()) {
		FAIL("Project path is not set.");
	}
	std::string path{var::ProjectPath.get()};
	AppendPath(&path, relativePath);
	return ReadFile(data, path);
}

} // namespace elastic
