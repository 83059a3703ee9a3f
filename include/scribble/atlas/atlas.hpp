// Scribble Texture Atlas
// atlas.hpp - Main atlas include header

#pragma once

#include "allocated_texture.hpp"
#include "atlas_error.hpp"
#include "atlas_format.hpp"
#include "atlas_storage.hpp"
#include "guillotine_allocator.hpp"
#include "layered_atlas.hpp"
#include "texture_mesh.hpp"
#include "texture_tiles.hpp"
