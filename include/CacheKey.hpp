#pragma once
#include <string>

// Separator between realm and id in flat key spaces
#define REALM_SEPARATOR "/"

// "realm/id" for backends without hierarchical namespaces; realms that are
// not plain file names are replaced by their digest
std::string flat_key(const std::string& id, const std::string& realm);

// Prefix matching every flat key of a realm
std::string realm_prefix(const std::string& realm);

// Hex SHA-256 digest
std::string sha256_hex(const std::string& data);

// name itself if usable as a file name, else its SHA-256 digest
std::string safe_file_name(const std::string& name);
