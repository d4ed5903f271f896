#pragma once
/*
 * CommandNoteGenerator
 *
 * Purpose: run an external explainer (e.g. `python3 word_ai.py --plain`) as a
 * child process and take its stdout as the note.
 * Invocation: <command...> --search <auto|tavily|off> [--plain] <term>
 * Exit status: 0 ok, 77 auth failure, 69/75 network failure, anything else a
 * provider error; no exit within the timeout kills the child (Timeout).
 */
#include <string>
#include <vector>
#include "note_generator.hpp"

class CommandNoteGenerator : public INoteGenerator {
public:
  CommandNoteGenerator(std::string command, int timeout_sec);
  Generation explain(const WordEntry& entry, const GenerateOptions& opts) const override;

  std::vector<std::string> build_argv(const std::string& term, const GenerateOptions& opts) const;
  static GenerationError classify_exit(int code);

private:
  std::string command_;
  int timeout_sec_;
};
