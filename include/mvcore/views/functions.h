// mvcore/views/functions.h
#ifndef MVCORE_VIEWS_FUNCTIONS_H
#define MVCORE_VIEWS_FUNCTIONS_H

#include "common/types.h"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mvcore {

class RenderContext;

using TemplateFunction = std::function<Value(const std::vector<Value>& args, const RenderContext& ctx)>;

// Functions callable from template expressions: @{upper(M.name)}, @{css('app.css')}
class FunctionRegistry {
public:
    FunctionRegistry(); // registers the built-in functions

    // Process wide registry holding only the built-ins
    static std::shared_ptr<const FunctionRegistry> shared_default();

    // html_safe: output is markup and is written without escaping
    template<typename Func>
    void register_function(std::string name, Func&& func, bool html_safe = false) {
        if (html_safe) html_safe_.insert(name);
        else html_safe_.erase(name);
        functions_[std::move(name)] = std::forward<Func>(func);
    }

    bool has_function(const std::string& name) const;
    bool is_html_safe(const std::string& name) const;

    // Unknown names and throwing functions yield null
    Value call_function(const std::string& name, const std::vector<Value>& args, const RenderContext& ctx) const;
    std::vector<std::string> list_functions() const;

private:
    void register_default_functions();

    std::unordered_map<std::string, TemplateFunction> functions_;
    std::unordered_set<std::string> html_safe_;
};

} // namespace mvcore

#endif // MVCORE_VIEWS_FUNCTIONS_H
