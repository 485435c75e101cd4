#pragma once

#include <string>
#include <vector>

#include "item_registry.hpp"

std::string render_upload_page(const std::string& token, const std::string& logo_text);
std::string render_share_page(const std::string& token,
                              const std::vector<RegistryItemSummary>& items,
                              const std::string& logo_text);
const std::string& upload_script();

// Banner line describing what ends the session.
std::string completion_hint(bool share_mode, bool exit_on_completion);

// Contents of the logo file with common indentation removed, or "" if the
// file is missing or blank.
std::string load_logo(const std::string& path);
