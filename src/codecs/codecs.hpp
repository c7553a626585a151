/**
 * Codeveil - Source Code Veiling Codecs
 *
 * codecs.hpp - Main include file for the codec layer
 *
 * Usage:
 *   #include "codecs/codecs.hpp"
 *
 *   codeveil::fragment::FragmentCipherCodec vortex;
 *   auto artifact = vortex.encode(source, key);
 *   auto restored = vortex.reconstruct(artifact.text);
 */

#ifndef CODEVEIL_CODECS_HPP
#define CODEVEIL_CODECS_HPP

// Shared primitives
#include "cipher/cipher_base.hpp"
#include "lexer/source_scanner.hpp"

// Codecs
#include "fragment/fragment_cipher.hpp"
#include "rename/identifier_rename.hpp"
#include "strings/string_extraction.hpp"

#endif // CODEVEIL_CODECS_HPP
