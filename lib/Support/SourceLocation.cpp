//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source-location rendering helpers.
///
/// Locations render as the schema path followed by the expression column when one is known.
///
//===----------------------------------------------------------------------===//

#include "llvmbinfmt/Frontend/SourceLocation.h"

#include <sstream>

namespace llvmbinfmt
{

std::string SourceLocation::str() const
{
    std::ostringstream out;
    out << (path.empty() ? "<schema>" : path);
    if (column > 0)
    {
        out << ':' << column;
    }
    return out.str();
}

}  // namespace llvmbinfmt
