#include "value_resolver.h"
#include "utils.h"

#include <cctype>

namespace partdb2kicad {

using ojson = nlohmann::ordered_json;

std::optional<ojson> find_attribute(const PartRecord& part, const std::string& key) {
    if (key == "id") return ojson(part.id);
    if (key == "name") return ojson(part.name);
    if (key == "category") {
        if (!part.has_category) return std::nullopt;
        ojson cat = ojson::object();
        cat["name"] = part.category.name;
        cat["full_path"] = part.category.full_path;
        return cat;
    }
    if (key == "parameters") {
        ojson bag = ojson::object();
        for (auto& [k, v] : part.parameters) bag[k] = v;
        return bag;
    }

    auto it = part.attributes.find(key);
    if (it == part.attributes.end() || it->is_null()) return std::nullopt;
    return *it;
}

std::string value_text(const ojson& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) {
        return value.is_number_unsigned() ? std::to_string(value.get<unsigned long long>())
                                          : std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) return fmt(value.get<double>());
    return value.dump();
}

bool unquote_literal(const std::string& text, std::string& out) {
    if (text.size() < 2 || text.front() != '\'' || text.back() != '\'') return false;
    auto first = text.find_first_not_of('\'');
    if (first == std::string::npos) {
        out.clear();
        return true;
    }
    auto last = text.find_last_not_of('\'');
    out = text.substr(first, last - first + 1);
    return true;
}

static std::optional<ojson> bag_entry(const PartRecord& part, const std::string& key) {
    const std::string* val = part.parameter(key);
    if (!val) return std::nullopt;
    return ojson(*val);
}

static std::string capitalize(const std::string& s) {
    if (s.empty()) return s;
    std::string out = to_lower(s);
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

std::string resolve(const PartRecord& part, const std::string& path) {
    if (path.empty()) return "";

    if (path.find('.') != std::string::npos) {
        auto hops = split_trimmed(path, '.');
        if (hops.empty()) return "";

        auto node = find_attribute(part, hops[0]);
        if (!node) node = bag_entry(part, hops[0]);
        if (!node) return "";

        for (size_t i = 1; i < hops.size(); i++) {
            if (!node->is_object()) return "";
            auto it = node->find(hops[i]);
            if (it == node->end() || it->is_null()) return "";
            ojson next = *it;
            node = std::move(next);
        }
        return value_text(*node);
    }

    if (auto attr = find_attribute(part, path)) return value_text(*attr);
    if (const std::string* val = part.parameter(path)) return *val;
    // Schema drift: parameters are sometimes stored as "Gender" when the
    // template asks for "gender"
    if (const std::string* val = part.parameter(capitalize(path))) return *val;
    return "";
}

} // namespace partdb2kicad
