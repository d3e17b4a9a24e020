#pragma once

#include <string>

namespace mds::database {

class DBConnection;

namespace schema {

inline constexpr const char* VERSION = "1";

// Verifies integrity and version, then creates any missing tables.
// Throws types::StoreError when the file is corrupt.
void ensure(const DBConnection& conn);

}

}
