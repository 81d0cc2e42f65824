#pragma once
// Grid layout primitives: sizes, text forms, occupancy grid, first-fit packer
// and the rectangle reconstructor.

#include "size.hpp"
#include "parse.hpp"
#include "rounded.hpp"
#include "grid.hpp"
#include "content.hpp"
#include "packer.hpp"
#include "visitor.hpp"
