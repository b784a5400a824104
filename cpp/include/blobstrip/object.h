#pragma once

/// @file object.h
/// Canonical git encoding of trees, commits and tags, and object ids.

#include "types.h"

#include <string>

namespace blobstrip {

/// Compute the git object id of `obj` ("<kind> <len>\0" + payload, SHA-1).
ObjectId hash_object(const Object& obj);

/// True if `id` is a 40-char lowercase hex string.
bool is_valid_id(const std::string& id);

/// Sort entries into git tree order (directories compare as "name/").
void sort_tree_entries(std::vector<TreeEntry>& entries);

// -- Encoding ---------------------------------------------------------------

Object encode_tree(const Tree& tree);
Object encode_commit(const Commit& commit);
Object encode_tag(const Tag& tag);

// -- Decoding ---------------------------------------------------------------
//
// `id` is only used for error messages.
// All decoders throw CorruptObjectError on malformed input or a kind
// mismatch.

Tree   decode_tree(const Object& obj, const ObjectId& id);
Commit decode_commit(const Object& obj, const ObjectId& id);
Tag    decode_tag(const Object& obj, const ObjectId& id);

} // namespace blobstrip
