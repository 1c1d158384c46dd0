#include "cifra/settings.h"

#include <pugixml.hpp>

#include <stdexcept>

namespace cifra {

std::string ResolverSettings::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

int ResolverSettings::get_int(const std::string& key, int fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    try {
        return std::stoi(it->second);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Option --" + key + " expects an integer, got '" + it->second + "'");
    }
}

double ResolverSettings::get_double(const std::string& key, double fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    try {
        return std::stod(it->second);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Option --" + key + " expects a number, got '" + it->second + "'");
    }
}

bool ResolverSettings::get_bool(const std::string& key, bool fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    const std::string& val = it->second;
    return val == "1" || val == "true" || val == "TRUE" || val == "yes";
}

namespace {

void push_option(ResolverSettings& settings, const std::string& key, const std::string& value) {
    settings.options[key] = value;
    if (key == "profile") {
        settings.profile = value;
    } else if (key == "input") {
        settings.input_file = value;
    } else if (key == "outfile") {
        settings.outfile = value;
    } else if (key == "settings") {
        settings.settings_file = value;
    } else if (key == "lexicon") {
        settings.lexicon_file = value;
    } else if (key == "escalation-response") {
        settings.escalation_response_file = value;
    } else if (key == "escalation-request") {
        settings.escalation_request_file = value;
    } else if (key == "verbose") {
        settings.verbose = settings.get_bool(key, false);
    } else if (key == "debug") {
        settings.debug = settings.get_bool(key, false);
    } else if (key == "strict") {
        settings.strict = settings.get_bool(key, false);
    }
}

} // namespace

ResolverSettings parse_arguments(int argc, char** argv) {
    ResolverSettings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            continue;
        }
        std::size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            std::string key = arg.substr(2);
            push_option(settings, key, "1");
        } else {
            std::string key = arg.substr(2, eq - 2);
            std::string value = arg.substr(eq + 1);
            push_option(settings, key, value);
        }
    }
    return settings;
}

ResolverSettings load_settings(const ResolverSettings& base) {
    ResolverSettings combined = base;
    std::string settings_path = base.settings_file.empty() ? "./settings.xml" : base.settings_file;

    pugi::xml_document doc;
    if (!doc.load_file(settings_path.c_str())) {
        throw std::runtime_error("Failed to load settings file: " + settings_path);
    }

    pugi::xml_node selected;
    for (auto item : doc.child("cifra").child("profiles").children("item")) {
        if (base.profile.empty() || std::string(item.attribute("pid").value()) == base.profile) {
            selected = item;
            break;
        }
    }

    if (!selected) {
        throw std::runtime_error(base.profile.empty()
            ? "No profile found in " + settings_path
            : "No profile '" + base.profile + "' in " + settings_path);
    }

    // Command line values win over the profile
    for (const auto& attr : selected.attributes()) {
        std::string key = attr.name();
        if (key == "pid" || base.options.count(key) > 0) {
            continue;
        }
        push_option(combined, key, attr.value());
    }

    return combined;
}

} // namespace cifra
