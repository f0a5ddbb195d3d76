// memory_ids.hpp
// Identifier, hashing and time helpers shared by documents and storage

#ifndef MEMORY_IDS_HPP
#define MEMORY_IDS_HPP

#include <string>

/// Generates a random (v4) UUID in lowercase canonical form, e.g. "550e8400-e29b-41d4-a716-446655440000".
std::string generate_memory_id();

/// SHA-256 of `content` as 64 lowercase hex chars.
///
/// Used as the content address of embeddings and as the content hash index of memories.
/// @throws MemoryError if the digest cannot be computed
std::string content_hash(const std::string &content);

/// Wall clock time in seconds since the Unix epoch, with sub-second precision.
double now_seconds();

#endif // MEMORY_IDS_HPP
