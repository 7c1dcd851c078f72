#ifndef IINSPECTOR_HPP
#define IINSPECTOR_HPP

#include "Types.hpp"

enum class InspectionDepth {
    Quick,
    Full
};

class IInspector {
public:
    virtual ~IInspector() = default;
    // Throws ExtractionError when the file cannot be read.
    virtual ContentSignal inspect(const ScannedFile& file, InspectionDepth depth) = 0;
};

#endif
