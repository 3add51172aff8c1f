#ifndef REDLINE_REPORT_H
#define REDLINE_REPORT_H

#include <iostream>
#include "redline/Compare.h"

namespace redline {

#define REPORT_TEXT_LIMIT 160

// Pretty-printed JSON summary of a comparison
void writeCompareReport(const CompareResult& result, std::ostream& os);

} // namespace redline

#endif // REDLINE_REPORT_H
