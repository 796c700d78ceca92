#include "rtcsv/artifact_writer.hpp"
#include "rtcsv/path_utils.hpp"
#include <filesystem>
#include <fstream>

namespace rtcsv {

static bool write_file(const std::filesystem::path& p, const std::string& body, std::string* err_out) {
  if (!ensure_parent_dirs(p)) {
    if (err_out) *err_out = "failed to create " + p.parent_path().string();
    return false;
  }
  std::ofstream out(p, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to write " + p.string();
    return false;
  }
  out.write(body.data(), static_cast<std::streamsize>(body.size()));
  if (!out) {
    if (err_out) *err_out = "short write to " + p.string();
    return false;
  }
  return true;
}

bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const std::string& run_json_str,
                      const std::string& rebuilt_text,
                      std::string* err_out) {
  const std::filesystem::path out_dir =
      std::filesystem::path(artifact_root) / slug;

  if (!write_file(out_dir / "run.json", run_json_str, err_out)) return false;
  return write_file(out_dir / "rebuilt.csv", rebuilt_text, err_out);
}

}
