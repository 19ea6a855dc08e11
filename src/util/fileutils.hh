/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string read_file( const std::filesystem::path& pathn );

/* std::nullopt if the attribute is not set */
std::optional<std::string> read_xattr( const std::filesystem::path& pathn,
                                       const std::string& name );

/* names of the entries in `dirn`, sorted */
std::vector<std::string> list_directory( const std::filesystem::path& dirn );
