#pragma once
#include <map>
#include <string>

struct BootScriptContext {
    std::string filesystem_name;
    std::string ssh_username;

    // Where Lambda mounts a filesystem on the instance, empty without one.
    std::string filesystem_mount() const;

    std::map<std::string, std::string> variables() const;
};

// Replaces "{{ name }}" placeholders. Unknown names are left untouched.
std::string render_template(const std::string& text, const std::map<std::string, std::string>& variables);

// Reads the user-data template at path, renders it and returns it base64 encoded.
std::string load_boot_script(const std::string& path, const BootScriptContext& context);
