#include <modeldiff/io/document_source.h>

#include <modeldiff/encodings/json.h>
#include <modeldiff/fs/file_io.h>
#include <modeldiff/utilities/errors.h>
#include <modeldiff/utilities/logging.h>

namespace modeldiff {

optional<dynamic>
directory_document_source::read_document(string const& name)
{
    auto path = root_ / name;
    std::error_code error;
    auto status = std::filesystem::status(path, error);
    if (status.type() != std::filesystem::file_type::not_found && error)
    {
        MODELDIFF_THROW(
            open_file_error() << file_path_info(path)
                              << internal_error_message_info(error.message()));
    }
    if (!std::filesystem::is_regular_file(status))
    {
        get_logger()->debug("no document at {}", path.string());
        return none;
    }
    return parse_json_value(read_file_contents(path));
}

optional<dynamic>
empty_document_source::read_document(string const&)
{
    return none;
}

void
memory_document_source::set_document(string const& name, string json)
{
    documents_[name] = std::move(json);
}

optional<dynamic>
memory_document_source::read_document(string const& name)
{
    auto document = documents_.find(name);
    if (document == documents_.end())
        return none;
    return parse_json_value(document->second);
}

} // namespace modeldiff
