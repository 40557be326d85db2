#include <oryx/core/time.hpp>
#include <oryx/runtime/column.hpp>

#include <cstdint>
#include <string>

// Column<T> is header-only. Explicit instantiations for the storage types of
// the runtime table keep template bloat out of the other translation units.

namespace oryx::runtime {

template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<Date>;
template class Column<Timestamp>;

}  // namespace oryx::runtime
