#ifndef LIMCALC_CATALOG_H
#define LIMCALC_CATALOG_H

#include <string>
#include <vector>

namespace limcalc {

struct CatalogEntry {
    std::string name;
    std::string expression;
    std::string approach;
    std::string description;
};

// Fixed examples used to pre-fill the input form
const std::vector<CatalogEntry>& example_catalog();

} // namespace limcalc

#endif // LIMCALC_CATALOG_H
