#pragma once
/*
 * OfflineNoteGenerator
 *
 * Purpose: note generator that needs no network or API key; builds a study
 * card from the loaded entry (phonetic, meaning, example) plus example
 * templates and exercises. Used for search mode "offline" and when no
 * external command is configured.
 */
#include "note_generator.hpp"

class OfflineNoteGenerator : public INoteGenerator {
public:
  explicit OfflineNoteGenerator(int sentences = 3) : sentences_(sentences) {}
  Generation explain(const WordEntry& entry, const GenerateOptions& opts) const override;
private:
  int sentences_;
};
