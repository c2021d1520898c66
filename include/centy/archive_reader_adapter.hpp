#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <string>

namespace centy {

// Feeds libarchive from an IReader. The reader must outlive the archive handle.
int OpenArchiveFromReader(struct archive* ar, IReader& reader);
std::string ArchiveErr(struct archive* ar);

} // namespace centy
