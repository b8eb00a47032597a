#ifndef MODELDIFF_IO_DOCUMENT_SOURCE_H
#define MODELDIFF_IO_DOCUMENT_SOURCE_H

#include <map>

#include <modeldiff/core.h>
#include <modeldiff/fs/types.h>

namespace modeldiff {

// document_source_interface is the interface to something that can supply
// documents by name (e.g., a directory holding the previous versions of a
// set of documents).
struct document_source_interface
{
    virtual ~document_source_interface()
    {
    }

    // Read the document called :name.
    // This returns none if there's no such document at this source, and it
    // throws a parsing_error if the document exists but isn't valid JSON.
    virtual optional<dynamic>
    read_document(string const& name) = 0;
};

// directory_document_source reads documents from JSON files in a directory.
// The document called "a/b.json" is the file "a/b.json" within the root.
struct directory_document_source : document_source_interface
{
    directory_document_source(file_path root) : root_(std::move(root))
    {
    }

    optional<dynamic>
    read_document(string const& name) override;

    file_path const&
    root() const
    {
        return root_;
    }

 private:
    file_path root_;
};

// empty_document_source never has any documents.
// This is the source of previous versions when there are none.
struct empty_document_source : document_source_interface
{
    optional<dynamic>
    read_document(string const& name) override;
};

// memory_document_source serves documents from JSON text held in memory.
struct memory_document_source : document_source_interface
{
    memory_document_source()
    {
    }

    memory_document_source(std::map<string, string> documents)
        : documents_(std::move(documents))
    {
    }

    // Set the JSON text of the document called :name.
    void
    set_document(string const& name, string json);

    optional<dynamic>
    read_document(string const& name) override;

 private:
    std::map<string, string> documents_;
};

} // namespace modeldiff

#endif
