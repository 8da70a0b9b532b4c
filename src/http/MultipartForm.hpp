#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace langcloud::http
{

struct FormPart
{
    std::string name;
    std::string filename; // empty for plain fields
    std::string content_type;
    std::string data;
};

// multipart/form-data body. File parts are read when added so a request
// never refers back to the filesystem once built.
class MultipartForm
{
public:
    // Throws std::invalid_argument when the file cannot be read.
    MultipartForm& addFile(const std::string& name, const std::filesystem::path& path, const std::string& content_type);
    MultipartForm& addData(const std::string& name, const std::string& filename, std::string data,
                           const std::string& content_type);
    MultipartForm& addField(const std::string& name, const std::string& value);

    const std::vector<FormPart>& parts() const { return parts_; }
    const FormPart* find(const std::string& name) const;
    bool empty() const { return parts_.empty(); }

private:
    std::vector<FormPart> parts_;
};

} // namespace langcloud::http
