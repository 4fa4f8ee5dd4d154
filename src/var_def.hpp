// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0

// Variable definitions. Don't include this file directly. This must be included
// from a file that defines the following macros:
//
// DEFVAR(name, type, default, description)

DEFVAR(DebugContext, bool, false, "If true, create a debug OpenGL context.")
DEFVAR(ProjectPath, std::string, "",
       "Path to the directory containing this project. If set, shaders are "
       "loaded from the shader directory instead of the executable.")
DEFVAR(Mesh, std::string, "box", "Mesh to display: box or sphere.")
DEFVAR(WindowWidth, int, 1280, "Initial window width.")
DEFVAR(WindowHeight, int, 720, "Initial window height.")
DEFVAR(VSync, bool, true, "If true, synchronize buffer swaps with the display.")
