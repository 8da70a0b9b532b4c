#include "MultipartForm.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace langcloud::http
{

MultipartForm& MultipartForm::addFile(const std::string& name, const std::filesystem::path& path,
                                      const std::string& content_type)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        throw std::invalid_argument("cannot read " + name + " file: " + path.string());

    std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
        throw std::invalid_argument("error while reading " + name + " file: " + path.string());

    return addData(name, path.filename().string(), std::move(data), content_type);
}

MultipartForm& MultipartForm::addData(const std::string& name, const std::string& filename, std::string data,
                                      const std::string& content_type)
{
    FormPart part;
    part.name = name;
    part.filename = filename;
    part.content_type = content_type;
    part.data = std::move(data);
    parts_.push_back(std::move(part));
    return *this;
}

MultipartForm& MultipartForm::addField(const std::string& name, const std::string& value)
{
    FormPart part;
    part.name = name;
    part.data = value;
    parts_.push_back(std::move(part));
    return *this;
}

const FormPart* MultipartForm::find(const std::string& name) const
{
    for (const auto& part : parts_)
    {
        if (part.name == name)
            return &part;
    }
    return nullptr;
}

} // namespace langcloud::http
