#include <tasklist/db_result.h>

namespace tasklist {

std::size_t DbResult::size() const {
    return impl_ ? impl_->row_count() : 0;
}

std::int64_t DbResult::affected_rows() const {
    return impl_ ? impl_->affected_rows() : 0;
}

Row DbResult::operator[](std::size_t index) const {
    if (index >= size()) {
        throw StoreError("Row " + std::to_string(index) + " requested from a result of " +
                         std::to_string(size()));
    }
    return Row(impl_, index);
}

} // namespace tasklist
