#include "pages.hpp"
#include "utils.hpp"

#include <fstream>
#include <sstream>

namespace {

const char* kStyle = R"CSS(
  body { font-family: system-ui, sans-serif; max-width: 40rem; margin: 2rem auto; padding: 0 1rem; color: #222; }
  .logo { color: #888; font-size: 0.6rem; line-height: 1; overflow-x: auto; }
  #drop { border: 2px dashed #aaa; border-radius: 8px; padding: 2rem; text-align: center; margin: 1rem 0; }
  #drop.drag { border-color: #2a7; background: #efe; }
  button { font-size: 1rem; padding: 0.5rem 1.5rem; }
  .muted { color: #888; }
  .ok { color: #2a7; }
  .err { color: #c33; }
  li { margin: 0.3rem 0; }
)CSS";

const char* kUploadTemplate = R"HTML(<!doctype html>
<html>
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>Upload</title>
<style>__STYLE__</style>
</head>
<body>
__ASCII_LOGO__
<h1>Upload files</h1>
<div id="drop">
  <p>Drop files here or pick them below</p>
  <input id="picker" type="file" multiple>
</div>
<button id="send">Upload</button>
<p id="status" class="muted"></p>
<div id="result"></div>
<script>window.__TOKEN__ = "__TOKEN_PLACEHOLDER__";</script>
<script src="/static/app.js"></script>
</body>
</html>
)HTML";

const char* kShareTemplate = R"HTML(<!doctype html>
<html>
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<title>Shared files</title>
<style>__STYLE__</style>
</head>
<body>
__ASCII_LOGO__
<h1>Shared files</h1>
<ul>__LIST_ITEMS__</ul>
</body>
</html>
)HTML";

const char* kUploadScript = R"JS(const token = window.__TOKEN__;
const picker = document.getElementById('picker');
const drop = document.getElementById('drop');
const send = document.getElementById('send');
const statusEl = document.getElementById('status');
const resultEl = document.getElementById('result');

function escapeHtml(s) {
  return String(s).replace(/[&<>"']/g, c => ({'&':'&amp;','<':'&lt;','>':'&gt;','"':'&quot;',"'":'&#x27;'}[c]));
}

function setBusy(busy) {
  send.disabled = busy;
  statusEl.textContent = busy ? 'Uploading…' : '';
}

drop.addEventListener('dragover', e => { e.preventDefault(); drop.classList.add('drag'); });
drop.addEventListener('dragleave', () => drop.classList.remove('drag'));
drop.addEventListener('drop', e => {
  e.preventDefault();
  drop.classList.remove('drag');
  picker.files = e.dataTransfer.files;
});

send.addEventListener('click', async () => {
  if (!picker.files || picker.files.length === 0) {
    alert('Please choose at least one file.');
    return;
  }
  const form = new FormData();
  for (const f of picker.files) form.append('files', f, f.name);
  setBusy(true);
  try {
    const res = await fetch(`/api/upload/${token}`, { method: 'POST', body: form });
    const data = await res.json();
    if (!res.ok) throw new Error(data.detail || 'Upload failed');
    resultEl.innerHTML = '<p class="ok">Uploaded:</p><ul>' +
      data.saved.map(n => `<li>${escapeHtml(n)}</li>`).join('') + '</ul>';
  } catch (err) {
    resultEl.innerHTML = `<p class="err">${escapeHtml(err.message)}</p>`;
  } finally {
    setBusy(false);
  }
});
)JS";

void replace_all(std::string& text, const std::string& from, const std::string& to){
  std::size_t pos = 0;
  while((pos = text.find(from, pos)) != std::string::npos){
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string logo_block(const std::string& logo_text){
  if(logo_text.find_first_not_of(" \t\r\n") == std::string::npos) return "";
  return "<pre class=\"logo\">" + html_escape(logo_text) + "</pre>";
}

} // namespace

std::string render_upload_page(const std::string& token, const std::string& logo_text){
  std::string html = kUploadTemplate;
  replace_all(html, "__STYLE__", kStyle);
  replace_all(html, "__ASCII_LOGO__", logo_block(logo_text));
  replace_all(html, "__TOKEN_PLACEHOLDER__", html_escape(token));
  return html;
}

std::string render_share_page(const std::string& token,
                              const std::vector<RegistryItemSummary>& items,
                              const std::string& logo_text){
  std::ostringstream list;
  for(const auto& item : items){
    std::string size = item.size_bytes ? human_size(*item.size_bytes) : "?";
    list << "<li><a href=\"/download/" << html_escape(token) << "/" << item.id << "\">"
         << html_escape(item.display_name) << "</a> <span class=\"muted\">("
         << size << ")</span></li>";
  }
  std::string html = kShareTemplate;
  replace_all(html, "__STYLE__", kStyle);
  replace_all(html, "__ASCII_LOGO__", logo_block(logo_text));
  replace_all(html, "__LIST_ITEMS__", list.str());
  return html;
}

const std::string& upload_script(){
  static const std::string script = kUploadScript;
  return script;
}

std::string completion_hint(bool share_mode, bool exit_on_completion){
  const char* transfer = share_mode ? "download" : "upload";
  if(exit_on_completion) return std::string("Will exit after the first completed ") + transfer;
  return std::string("Tip: --exit-on-upload stops the server after the first completed ") + transfer;
}

std::string load_logo(const std::string& path){
  if(path.empty()) return "";
  std::ifstream in(path, std::ios::binary);
  if(!in) return "";
  std::ostringstream ss;
  ss << in.rdbuf();
  std::string text = ss.str();
  while(!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
  if(text.find_first_not_of(" \t\r\n") == std::string::npos) return "";
  return trim_common_left_spaces(text);
}
