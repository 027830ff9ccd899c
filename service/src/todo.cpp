#include <tasklist/todo.h>
#include <tasklist/util/string.h>

namespace tasklist {

namespace {

    std::optional<ValidationError> check_field(const std::string& name, const std::optional<std::string>& value) {
        if (!value.has_value()) {
            return ValidationError{name, "Todo validation failed: " + name + ": Path `" + name + "` is required."};
        }
        if (value->empty()) {
            return ValidationError{name, "Todo validation failed: " + name + ": Path `" + name + "` must not be empty."};
        }
        if (util::utf16_length(*value) > kMaxFieldLength) {
            return ValidationError{name, "Todo validation failed: " + name + ": Path `" + name +
                "` is longer than the maximum allowed length (" + std::to_string(kMaxFieldLength) + ")."};
        }
        return std::nullopt;
    }

}

std::optional<ValidationError> validate(const std::optional<std::string>& title,
                                        const std::optional<std::string>& description) {
    if (auto err = check_field("title", title)) {
        return err;
    }
    return check_field("description", description);
}

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Todo& todo) {
    jv = {
        {"id", todo.id},
        {"title", todo.title},
        {"description", todo.description},
        {"createdAt", util::format_timestamp(todo.created_at)},
        {"updatedAt", util::format_timestamp(todo.updated_at)}
    };
}

} // namespace tasklist
