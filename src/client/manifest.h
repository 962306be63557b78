#pragma once
#include "file_registry.h"
#include "status.h"

#include <string>
#include <utility>

// Parses a JSON manifest of the form {"files": {"<name>": "<url>", ...}}.
std::pair<Status, FileMap> parse_manifest(const std::string &json);

// Reads and parses the manifest stored at path.
std::pair<Status, FileMap> load_manifest(const std::string &path);
