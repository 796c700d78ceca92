#pragma once
#include <string>

namespace rtcsv {

// Writes the check artifacts for one input:
//   <artifact_root>/<slug>/run.json
//   <artifact_root>/<slug>/rebuilt.csv  (every record rebuilt from typed state)
bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const std::string& run_json_str,
                      const std::string& rebuilt_text,
                      std::string* err_out = nullptr);

}
