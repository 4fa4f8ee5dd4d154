// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <string>
#include <string_view>

namespace elastic {

// Append a relative path to an existing path. The relative path must be
// non-empty and must not start with a slash.
void AppendPath(std::string *path, std::string_view relativePath);

// Read a file into memory. Logs and returns false on failure.
bool ReadFile(std::string *data, const std::string &path);

// Read a file relative to the ProjectPath variable into memory. Logs and
// returns false on failure.
bool ReadProjectFile(std::string *data, std::string_view relativePath);

} // namespace elastic
