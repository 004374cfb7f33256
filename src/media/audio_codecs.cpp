/// @file audio_codecs.cpp
/// @brief Audio decoder library implementations
///
/// This file provides the single-compilation-unit implementations for the
/// header-only decoders used by decode_audio_clip.

// dr_wav - WAV decoding
#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

// minimp3 - MPEG audio decoding
#define MINIMP3_IMPLEMENTATION
#include <minimp3_ex.h>

// stb_vorbis - Ogg Vorbis decoding
#include <stb_vorbis.c>
