#pragma once

#include "codec/Utf.hpp"
#include "core/Error.hpp"
#include "pure/Extension.hpp"
#include "pure/PurePath.hpp"
#include "resolve/AbsolutePathResolver.hpp"
#include "resolve/PosixAbsolute.hpp"
#include "resolve/WinAbsolute.hpp"
#include "windows/Clean.hpp"
#include "windows/PathKind.hpp"
#include "windows/WindowsPath.hpp"
