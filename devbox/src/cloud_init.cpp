#include "cloud_init.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::string BootScriptContext::filesystem_mount() const {
    if (filesystem_name.empty()) {
        return "";
    }
    return "/lambda/nfs/" + filesystem_name;
}

std::map<std::string, std::string> BootScriptContext::variables() const {
    return {
        {"filesystem_name", filesystem_name},
        {"filesystem_mount", filesystem_mount()},
        {"ssh_username", ssh_username},
    };
}

std::string render_template(const std::string& text, const std::map<std::string, std::string>& variables) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find("{{", pos);
        if (open == std::string::npos) {
            break;
        }
        auto close = text.find("}}", open + 2);
        if (close == std::string::npos) {
            break;
        }

        out.append(text, pos, open - pos);

        auto name = util::trim(text.substr(open + 2, close - open - 2));
        auto it = variables.find(name);
        if (it != variables.end()) {
            out.append(it->second);
        } else {
            out.append(text, open, close + 2 - open);
        }
        pos = close + 2;
    }

    out.append(text, pos, std::string::npos);
    return out;
}

std::string load_boot_script(const std::string& path, const BootScriptContext& context) {
    auto text = util::read_file(path);
    auto rendered = render_template(text, context.variables());
    spdlog::debug("Rendered boot script {} ({} bytes)", path, rendered.size());
    return util::base64_encode(rendered);
}
