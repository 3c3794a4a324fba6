// src/views/functions.cpp
#include "mvcore/views/functions.h"
#include "mvcore/views/render_context.h"
#include "common/log.h"
#include "common/utils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace mvcore {

namespace {

std::string string_arg(const std::vector<Value>& args, size_t i) {
    if (i < args.size() && args[i].is_string()) return args[i].get<std::string>();
    return "";
}

// Numbers outside the int64 range saturate
bool int_arg(const std::vector<Value>& args, size_t i, int64_t& out) {
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    if (i >= args.size() || !args[i].is_number()) return false;
    const Value& v = args[i];
    if (v.is_number_unsigned()) {
        uint64_t u = v.get<uint64_t>();
        out = u > static_cast<uint64_t>(kMax) ? kMax : static_cast<int64_t>(u);
    } else if (v.is_number_integer()) {
        out = v.get<int64_t>();
    } else {
        double d = v.get<double>();
        if (std::isnan(d)) return false;
        if (d >= 9223372036854775807.0) out = kMax;
        else if (d <= -9223372036854775808.0) out = kMin;
        else out = static_cast<int64_t>(d);
    }
    return true;
}

std::string transform_case(std::string s, bool upper) {
    std::transform(s.begin(), s.end(), s.begin(), [upper](unsigned char c) {
        return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
    });
    return s;
}

// Guards range() against runaway templates
constexpr int64_t kMaxRangeLength = 100000;

} // namespace

FunctionRegistry::FunctionRegistry() {
    register_default_functions();
}

std::shared_ptr<const FunctionRegistry> FunctionRegistry::shared_default() {
    static const std::shared_ptr<const FunctionRegistry> registry = std::make_shared<FunctionRegistry>();
    return registry;
}

void FunctionRegistry::register_default_functions() {
    register_function("css", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        std::string href = string_arg(args, 0);
        if (href.empty()) return "";
        return "<link rel=\"stylesheet\" href=\"" + html_escape(href) + "\">";
    }, true);

    register_function("js", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        std::string src = string_arg(args, 0);
        if (src.empty()) return "";
        return "<script src=\"" + html_escape(src) + "\"></script>";
    }, true);

    register_function("image", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        std::string src = string_arg(args, 0);
        if (src.empty()) return "";
        std::string attrs;
        if (args.size() > 1 && args[1].is_number()) attrs += " width=\"" + value_to_string(args[1]) + "\"";
        if (args.size() > 2 && args[2].is_number()) attrs += " height=\"" + value_to_string(args[2]) + "\"";
        if (args.size() > 3 && args[3].is_string()) attrs += " alt=\"" + html_escape(args[3].get<std::string>()) + "\"";
        return "<img src=\"" + html_escape(src) + "\"" + attrs + ">";
    }, true);

    register_function("meta", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        std::string tags;
        if (!args.empty() && args[0].is_string()) {
            std::string title = html_escape(args[0].get<std::string>());
            tags += "<meta property=\"og:title\" content=\"" + title + "\">";
            tags += "<meta name=\"twitter:title\" content=\"" + title + "\">";
        }
        if (args.size() > 1 && args[1].is_string()) {
            std::string desc = html_escape(args[1].get<std::string>());
            tags += "<meta name=\"description\" content=\"" + desc + "\">";
            tags += "<meta property=\"og:description\" content=\"" + desc + "\">";
        }
        return tags;
    }, true);

    register_function("json", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        if (args.empty()) return "{}";
        return dump_json(args[0]);
    });

    register_function("range", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        int64_t start = 0;
        int64_t stop = 0;
        int64_t step = 1;
        Value out = Value::array();
        if (args.size() == 1) {
            if (!int_arg(args, 0, stop)) return out;
        } else if (args.size() >= 2) {
            if (!int_arg(args, 0, start) || !int_arg(args, 1, stop)) return out;
            if (args.size() > 2 && !int_arg(args, 2, step)) step = 1;
        }
        constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
        constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
        if (step > 0) {
            for (int64_t i = start; i < stop && static_cast<int64_t>(out.size()) < kMaxRangeLength; i += step) {
                out.push_back(i);
                if (i > kMax - step) break;
            }
        } else if (step < 0) {
            for (int64_t i = start; i > stop && static_cast<int64_t>(out.size()) < kMaxRangeLength; i += step) {
                out.push_back(i);
                if (i < kMin - step) break;
            }
        }
        return out;
    });

    auto length = [](const std::vector<Value>& args, const RenderContext&) -> Value {
        if (args.size() != 1) return nullptr;
        const Value& v = args[0];
        if (v.is_string()) return v.get_ref<const std::string&>().size();
        if (v.is_array() || v.is_object()) return v.size();
        return 0;
    };
    register_function("len", length);
    register_function("length", length);

    auto upper = [](const std::vector<Value>& args, const RenderContext&) -> Value {
        if (args.size() != 1) return nullptr;
        return args[0].is_string() ? Value(transform_case(args[0].get<std::string>(), true)) : args[0];
    };
    register_function("upper", upper);
    register_function("toUpperCase", upper);

    auto lower = [](const std::vector<Value>& args, const RenderContext&) -> Value {
        if (args.size() != 1) return nullptr;
        return args[0].is_string() ? Value(transform_case(args[0].get<std::string>(), false)) : args[0];
    };
    register_function("lower", lower);
    register_function("toLowerCase", lower);

    register_function("trim", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        if (args.empty() || !args[0].is_string()) return args.empty() ? Value(nullptr) : args[0];
        return trim(args[0].get<std::string>());
    });

    register_function("default", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        if (args.empty()) return nullptr;
        if (is_truthy(args[0]) || args.size() < 2) return args[0];
        return args[1];
    });

    register_function("join", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        if (args.empty() || !args[0].is_array()) return "";
        std::string sep = args.size() > 1 ? value_to_string(args[1]) : ",";
        std::string out;
        for (size_t i = 0; i < args[0].size(); ++i) {
            if (i > 0) out += sep;
            out += value_to_string(args[0][i]);
        }
        return out;
    });

    register_function("encode", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        if (args.empty()) return "";
        return html_escape(value_to_string(args[0]));
    }, true);

    // Explicit opt-out of escaping: @{raw(M.html)}
    register_function("raw", [](const std::vector<Value>& args, const RenderContext&) -> Value {
        if (args.empty()) return "";
        return value_to_string(args[0]);
    }, true);

    register_function("url", [](const std::vector<Value>& args, const RenderContext& ctx) -> Value {
        if (!args.empty() && args[0].is_string()) {
            return args[0].get<std::string>() + ctx.url();
        }
        return ctx.url();
    });

    register_function("csrf", [](const std::vector<Value>& args, const RenderContext& ctx) -> Value {
        std::string token_id = string_arg(args, 0);
        if (token_id.empty()) token_id = "_csrf_token";
        Value token = RenderContext::get_nested_value(ctx.session(), {token_id, "token"});
        if (!token.is_string()) return "";
        return "<input type=\"hidden\" name=\"" + html_escape_attribute(token_id) + "\" value=\"" +
               html_escape_attribute(token.get<std::string>()) + "\">";
    }, true);

    register_function("translate", [](const std::vector<Value>& args, const RenderContext& ctx) -> Value {
        std::string key = string_arg(args, 0);
        if (key.empty()) return "";
        if (const Translator* t = ctx.translator()) return t->translate_key(key);
        return "[" + key + "]";
    });
}

bool FunctionRegistry::has_function(const std::string& name) const {
    return functions_.count(name) > 0;
}

bool FunctionRegistry::is_html_safe(const std::string& name) const {
    return html_safe_.count(name) > 0;
}

Value FunctionRegistry::call_function(const std::string& name, const std::vector<Value>& args, const RenderContext& ctx) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) {
        return nullptr;
    }
    try {
        return it->second(args, ctx);
    } catch (const std::exception& e) {
        log_warning("Template function '" + name + "' failed: " + e.what());
        return nullptr;
    }
}

std::vector<std::string> FunctionRegistry::list_functions() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [name, _] : functions_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace mvcore
