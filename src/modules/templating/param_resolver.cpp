// modules/templating/param_resolver.cpp
#include "templating/param_resolver.h"
#include <algorithm>
#include <cmath>
#include <vector>

namespace comfyflow {

namespace {

int64_t round_to_int(double v) {
    // round-half-to-even, same as the default FP rounding mode
    return static_cast<int64_t>(std::nearbyint(v));
}

} // namespace

Value ParamResolver::clamp_value(const nlohmann::json& limits, const std::string& key, const Value& value) {
    if (!limits.is_object() || !value.is_number()) {
        return value;
    }
    auto it = limits.find(key);
    if (it == limits.end() || !it->is_object()) {
        return value;
    }

    double v = value.get<double>();
    if (it->contains("min") && (*it)["min"].is_number()) {
        v = std::max(v, (*it)["min"].get<double>());
    }
    if (it->contains("max") && (*it)["max"].is_number()) {
        v = std::min(v, (*it)["max"].get<double>());
    }
    if (value.is_number_integer()) {
        return static_cast<int64_t>(v);
    }
    return v;
}

ParameterSet ParamResolver::resolve(const TopicConfig& topic,
                                    const ParameterSet& inline_params,
                                    const std::optional<Dimensions>& input_dims) {
    ParameterSet result = normalize_params(topic.rule_defaults);
    result.update(normalize_params(topic.defaults));

    if (input_dims) {
        if (result.contains("width") && result["width"].is_number_integer() && result["width"].get<int64_t>() == 0) {
            result["width"] = input_dims->first;
        }
        if (result.contains("height") && result["height"].is_number_integer() && result["height"].get<int64_t>() == 0) {
            result["height"] = input_dims->second;
        }
    }

    ParameterSet filtered = ParameterSet::object();
    for (auto it = inline_params.begin(); it != inline_params.end(); ++it) {
        std::string key = to_lower_copy(it.key());
        if (!topic.inline_allowed || topic.inline_allowed->count(key) > 0) {
            filtered[key] = it.value();
        }
    }

    const auto& limits = topic.inline_limits;
    for (auto it = filtered.begin(); it != filtered.end(); ++it) {
        if (it.key() == "width" || it.key() == "height") continue;
        result[it.key()] = clamp_value(limits, it.key(), it.value());
    }

    Value w_cur = result.contains("width") ? result["width"] : Value();
    Value h_cur = result.contains("height") ? result["height"] : Value();
    if (filtered.contains("width")) w_cur = filtered["width"];
    if (filtered.contains("height")) h_cur = filtered["height"];

    if (w_cur.is_number() && h_cur.is_number()) {
        const double w0 = w_cur.get<double>();
        const double h0 = h_cur.get<double>();
        const double w_pre = clamp_value(limits, "width", w0).get<double>();
        const double h_pre = clamp_value(limits, "height", h0).get<double>();

        std::vector<double> scales;
        if (w_pre != w0 && w0 != 0) scales.push_back(w_pre / w0);
        if (h_pre != h0 && h0 != 0) scales.push_back(h_pre / h0);

        Value w_final;
        Value h_final;
        if (!scales.empty()) {
            double scale = 1.0;
            double min_down = 1.0;
            double max_up = 1.0;
            for (double s : scales) {
                if (s < 1.0) min_down = std::min(min_down, s);
                if (s > 1.0) max_up = std::max(max_up, s);
            }
            if (min_down < 1.0) {
                scale = min_down;
            } else if (max_up > 1.0) {
                scale = max_up;
            }
            w_final = clamp_value(limits, "width", round_to_int(w0 * scale));
            h_final = clamp_value(limits, "height", round_to_int(h0 * scale));
        } else {
            w_final = clamp_value(limits, "width", w_cur.is_number_integer() ? Value(round_to_int(w0)) : w_cur);
            h_final = clamp_value(limits, "height", h_cur.is_number_integer() ? Value(round_to_int(h0)) : h_cur);
        }

        if (w_final.is_number_float()) w_final = round_to_int(w_final.get<double>());
        if (h_final.is_number_float()) h_final = round_to_int(h_final.get<double>());
        result["width"] = w_final;
        result["height"] = h_final;
    } else {
        if (w_cur.is_number()) {
            result["width"] = round_to_int(clamp_value(limits, "width", w_cur).get<double>());
        }
        if (h_cur.is_number()) {
            result["height"] = round_to_int(clamp_value(limits, "height", h_cur).get<double>());
        }
    }

    return result;
}

} // namespace comfyflow
