#pragma once

#include <string>

namespace wedge
{

class DisplayList;

class SvgExporter
{
   public:
    // Serialize the recorded commands of a DisplayList. The document size is
    // the list's display size in logical units.
    static std::string to_string(const DisplayList& list);

    // Returns false if the file cannot be written.
    static bool write_svg(const std::string& path, const DisplayList& list);
};

}   // namespace wedge
