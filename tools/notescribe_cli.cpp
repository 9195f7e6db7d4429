/// @file notescribe_cli.cpp
/// @brief Command-line interface for notescribe transcription.

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "analysis/chord_templates.h"
#include "analysis/transcriber.h"
#include "analysis/transcription_json.h"
#include "core/audio_io.h"
#include "core/sample_buffer.h"
#include "notescribe.h"
#include "util/json_writer.h"

using namespace notescribe;

// ============================================================================
// CLI Arguments
// ============================================================================

struct CliArgs {
  std::string command;
  std::string input_file;
  std::string output_file;
  bool json_output = false;
  bool quiet = false;
  bool help = false;
  bool raw = false;

  std::map<std::string, std::string> options;

  float get_float(const std::string& k, float def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stof(it->second) : def;
  }

  int get_int(const std::string& k, int def) const {
    auto it = options.find(k);
    return it != options.end() ? std::stoi(it->second) : def;
  }

  bool has(const std::string& k) const { return options.count(k) > 0; }

  bool verbose() const { return !quiet && !json_output; }
};

// ============================================================================
// Argument Parser
// ============================================================================

class ArgParser {
 public:
  static CliArgs parse(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
      } else if (arg == "--json") {
        args.json_output = true;
      } else if (arg == "--quiet" || arg == "-q") {
        args.quiet = true;
      } else if (arg == "--raw") {
        args.raw = true;
      } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
        args.output_file = argv[++i];
      } else if (arg.substr(0, 2) == "--") {
        parse_option(args, arg.substr(2), argv, i, argc);
      } else if (args.command.empty()) {
        args.command = arg;
      } else if (args.input_file.empty()) {
        args.input_file = arg;
      }
    }

    return args;
  }

 private:
  static void parse_option(CliArgs& args, const std::string& key, char* argv[], int& i, int argc) {
    if (i + 1 < argc) {
      std::string next = argv[i + 1];
      bool is_negative_num =
          next.size() > 1 && next[0] == '-' && std::isdigit(static_cast<unsigned char>(next[1]));
      bool is_option = next.size() > 1 && next[0] == '-' && !is_negative_num;

      if (!is_option) {
        args.options[key] = argv[++i];
        return;
      }
    }
    args.options[key] = "true";
  }
};

// ============================================================================
// Output Helpers
// ============================================================================

void progress_callback(float progress, const char* stage) {
  std::cerr << "\r" << stage << ": " << static_cast<int>(progress * 100) << "%   " << std::flush;
}

void clear_progress() { std::cerr << "\r                              \r"; }

TranscriberConfig build_config(const CliArgs& args) {
  TranscriberConfig config;
  config.fallback_sample_rate = args.get_int("sample-rate", config.fallback_sample_rate);
  config.segment_length = args.get_int("segment-length", config.segment_length);
  config.min_frequency = args.get_float("fmin", config.min_frequency);
  config.max_frequency = args.get_float("fmax", config.max_frequency);
  config.gap_tolerance = args.get_float("gap-tolerance", config.gap_tolerance);
  config.chord_window = args.get_float("chord-window", config.chord_window);
  config.min_chord_tones = args.get_int("min-chord-tones", config.min_chord_tones);
  config.min_chord_match_ratio = args.get_float("min-chord-ratio", config.min_chord_match_ratio);
  return config;
}

TranscriptionResult run_transcription(const CliArgs& args, const SampleBuffer& buffer) {
  Transcriber transcriber(build_config(args));
  if (args.verbose()) {
    transcriber.set_progress_callback(progress_callback);
  }
  TranscriptionResult result = transcriber.transcribe(buffer);
  if (args.verbose()) {
    clear_progress();
  }
  return result;
}

std::string format_time(float seconds) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%7.3fs", seconds);
  return buf;
}

void print_notes(std::ostream& out, const std::vector<SimpleNote>& notes) {
  out << "Notes (" << notes.size() << "):\n";
  for (const auto& note : notes) {
    out << "  " << format_time(note.start) << "  " << std::left << std::setw(4)
        << (note.display_name() + std::to_string(note.octave)) << std::right << "  "
        << std::fixed << std::setprecision(3) << note.duration << "s\n";
  }
}

void print_chords(std::ostream& out, const std::vector<Chord>& chords) {
  out << "Chords (" << chords.size() << "):\n";
  for (const auto& chord : chords) {
    out << "  " << format_time(chord.start) << " - " << format_time(chord.end) << "  "
        << pitch_class_name(chord.root) << " " << chord_type_name(chord.type) << "  [";
    for (size_t i = 0; i < chord.notes.size(); ++i) {
      if (i > 0) out << " ";
      out << pitch_class_name(chord.notes[i]);
    }
    out << "]\n";
  }
}

void print_sheet(std::ostream& out, const SheetMusic& sheet) {
  out << "Sheet Music: " << sheet.time_signature.numerator << "/"
      << sheet.time_signature.denominator << ", " << clef_name(sheet.clef) << " clef, "
      << std::fixed << std::setprecision(1) << sheet.tempo_bpm << " BPM\n";
  for (const auto& note : sheet.notes) {
    out << "  " << format_time(note.start) << "  " << std::left << std::setw(4)
        << (std::string(pitch_class_name(note.pitch)) + std::to_string(note.octave))
        << std::right << "  " << note_duration_name(note.duration) << "\n";
  }
}

// ============================================================================
// Command Handler Type
// ============================================================================

using CommandHandler = std::function<int(const CliArgs&, const SampleBuffer&, std::ostream&)>;

// ============================================================================
// Command Implementations
// ============================================================================

int cmd_version(const CliArgs& args, std::ostream& out) {
  if (args.json_output) {
    out << JsonWriter()
               .begin_object()
               .kv("cli_version", NOTESCRIBE_VERSION_STRING)
               .kv("lib_version", version())
               .end_object()
               .str()
        << "\n";
  } else {
    out << "notescribe-cli version " << NOTESCRIBE_VERSION_STRING << "\n";
    out << "notescribe version " << version() << "\n";
  }
  return 0;
}

int cmd_info(const CliArgs& args, const SampleBuffer& buffer, std::ostream& out) {
  float peak = 0.0f;
  double sum_sq = 0.0;
  size_t count = 0;
  for (int ch = 0; ch < buffer.channels(); ++ch) {
    for (float v : buffer.channel(ch)) {
      peak = std::max(peak, std::abs(v));
      sum_sq += static_cast<double>(v) * v;
      ++count;
    }
  }
  float rms = count > 0 ? static_cast<float>(std::sqrt(sum_sq / count)) : 0.0f;
  float peak_db = 20.0f * std::log10(std::max(peak, 1e-10f));
  float rms_db = 20.0f * std::log10(std::max(rms, 1e-10f));

  if (args.json_output) {
    out << JsonWriter()
               .begin_object()
               .kv("path", args.input_file)
               .kv("duration", buffer.duration())
               .kv("sample_rate", buffer.sample_rate())
               .kv("channels", buffer.channels())
               .kv("samples", buffer.size())
               .kv("peak_db", peak_db)
               .kv("rms_db", rms_db)
               .end_object()
               .str()
        << "\n";
  } else {
    int mins = static_cast<int>(buffer.duration()) / 60;
    float secs = buffer.duration() - mins * 60;
    out << "Audio File: " << args.input_file << "\n";
    out << "  Duration:    " << mins << ":" << std::fixed << std::setprecision(1) << secs << " ("
        << buffer.duration() << "s)\n";
    out << "  Sample Rate: " << buffer.sample_rate() << " Hz\n";
    out << "  Channels:    " << buffer.channels() << "\n";
    out << "  Samples:     " << buffer.size() << "\n";
    out << "  Peak Level:  " << peak_db << " dB\n";
    out << "  RMS Level:   " << rms_db << " dB\n";
  }
  return 0;
}

int cmd_transcribe(const CliArgs& args, const SampleBuffer& buffer, std::ostream& out) {
  TranscriptionResult result = run_transcription(args, buffer);

  if (args.json_output) {
    out << to_json(result) << "\n";
  } else {
    out << "Key:   " << result.detected_key.to_string() << " (confidence: " << std::fixed
        << std::setprecision(2) << result.detected_key.confidence << ")\n";
    out << "Tempo: " << std::setprecision(1) << result.detected_tempo << " BPM\n";
    out << "Pitch samples: " << result.raw_pitch_data.size() << "\n\n";
    print_notes(out, result.simple_notes);
    out << "\n";
    print_chords(out, result.complex_chords);
    out << "\n";
    print_sheet(out, result.sheet_music);
  }
  return 0;
}

int cmd_notes(const CliArgs& args, const SampleBuffer& buffer, std::ostream& out) {
  TranscriptionResult result = run_transcription(args, buffer);

  if (args.json_output) {
    JsonWriter json;
    json.begin_array();
    for (const auto& note : result.simple_notes) write_json(json, note);
    json.end_array();
    out << json.str() << "\n";
  } else {
    print_notes(out, result.simple_notes);
  }
  return 0;
}

int cmd_chords(const CliArgs& args, const SampleBuffer& buffer, std::ostream& out) {
  TranscriptionResult result = run_transcription(args, buffer);

  if (args.json_output) {
    JsonWriter json;
    json.begin_array();
    for (const auto& chord : result.complex_chords) write_json(json, chord);
    json.end_array();
    out << json.str() << "\n";
  } else {
    print_chords(out, result.complex_chords);
  }
  return 0;
}

int cmd_sheet(const CliArgs& args, const SampleBuffer& buffer, std::ostream& out) {
  TranscriptionResult result = run_transcription(args, buffer);

  if (args.json_output) {
    JsonWriter json;
    write_json(json, result.sheet_music);
    out << json.str() << "\n";
  } else {
    print_sheet(out, result.sheet_music);
  }
  return 0;
}

int cmd_pitch(const CliArgs& args, const SampleBuffer& buffer, std::ostream& out) {
  TranscriptionResult result = run_transcription(args, buffer);

  if (args.json_output) {
    JsonWriter json;
    json.begin_array();
    for (const auto& sample : result.raw_pitch_data) write_json(json, sample);
    json.end_array();
    out << json.str() << "\n";
  } else {
    out << "Pitch samples (" << result.raw_pitch_data.size() << "):\n";
    for (const auto& sample : result.raw_pitch_data) {
      out << "  " << format_time(sample.start) << "  " << std::fixed << std::setprecision(2)
          << std::setw(8) << sample.frequency << " Hz  " << std::left << std::setw(4)
          << sample.note.to_string() << std::right << " " << std::showpos << sample.note.cents
          << std::noshowpos << " cents\n";
    }
  }
  return 0;
}

int cmd_key(const CliArgs& args, const SampleBuffer& buffer, std::ostream& out) {
  TranscriptionResult result = run_transcription(args, buffer);
  const Key& key = result.detected_key;

  if (args.json_output) {
    out << JsonWriter()
               .begin_object()
               .kv("root", static_cast<int>(key.root))
               .kv("mode", static_cast<int>(key.mode))
               .kv("confidence", key.confidence)
               .kv("name", key.to_string())
               .end_object()
               .str()
        << "\n";
  } else {
    out << "Key: " << key.to_string() << " (confidence: " << key.confidence << ")\n";
  }
  return 0;
}

// ============================================================================
// Command Registry
// ============================================================================

struct CommandInfo {
  std::string name;
  std::string description;
  CommandHandler handler;
};

const std::vector<CommandInfo>& get_commands() {
  static std::vector<CommandInfo> commands = {
      {"transcribe", "Full transcription (notes, chords, sheet music)", cmd_transcribe},
      {"notes", "Consolidated notes only", cmd_notes},
      {"chords", "Identified chords only", cmd_chords},
      {"sheet", "Quantized sheet music only", cmd_sheet},
      {"pitch", "Raw per-segment pitch samples", cmd_pitch},
      {"key", "Estimated key", cmd_key},
      {"info", "Show audio file information", cmd_info},
  };
  return commands;
}

const CommandInfo* find_command(const std::string& name) {
  for (const auto& cmd : get_commands()) {
    if (cmd.name == name) return &cmd;
  }
  return nullptr;
}

// ============================================================================
// Usage
// ============================================================================

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options] <audio_file> [-o output]\n\n";

  std::cerr << "COMMANDS:\n";
  for (const auto& cmd : get_commands()) {
    fprintf(stderr, "  %-14s %s\n", cmd.name.c_str(), cmd.description.c_str());
  }
  std::cerr << "  version        Show library version\n";

  std::cerr << "\nGLOBAL OPTIONS:\n"
            << "  --json                   Output results in JSON format\n"
            << "  --quiet, -q              Suppress progress output\n"
            << "  --help, -h               Show help\n"
            << "  -o, --output <path>      Write results to a file\n"
            << "\nINPUT OPTIONS:\n"
            << "  --raw                    Input is headerless interleaved float32 PCM\n"
            << "  --channels <int>         Channels of raw input (default: 1)\n"
            << "  --sample-rate <int>      Sample rate of raw input (default: 44100)\n"
            << "\nANALYSIS OPTIONS:\n"
            << "  --segment-length <int>   Analysis window in samples (default: 4096)\n"
            << "  --fmin <hz>              Lowest detectable pitch (default: 80)\n"
            << "  --fmax <hz>              Highest detectable pitch (default: 1000)\n"
            << "  --gap-tolerance <sec>    Note merge gap (default: 0.05)\n"
            << "  --chord-window <sec>     Chord bucket width (default: 0.2)\n"
            << "  --min-chord-tones <int>  Template tones required (default: 3)\n"
            << "  --min-chord-ratio <f>    Template fraction required (default: 0.75)\n"
            << "\nExamples:\n"
            << "  " << prog << " transcribe melody.wav\n"
            << "  " << prog << " chords piano.mp3 --json\n"
            << "  " << prog << " transcribe --raw --channels 2 --sample-rate 48000 take.f32 -o out.json --json\n";
}

// ============================================================================
// Main
// ============================================================================

SampleBuffer load_input(const CliArgs& args) {
  if (args.raw) {
    // Headerless PCM carries no rate; --sample-rate overrides the configured fallback.
    TranscriberConfig config = build_config(args);
    validate_config(config);
    return load_raw_f32(args.input_file, args.get_int("channels", 1),
                        config.fallback_sample_rate);
  }
  return load_audio(args.input_file);
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  CliArgs args = ArgParser::parse(argc, argv);

  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command.empty()) {
    std::cerr << "Error: No command specified\n\n";
    print_usage(argv[0]);
    return 1;
  }

  try {
    std::ofstream file;
    if (!args.output_file.empty()) {
      file.open(args.output_file);
      if (!file.is_open()) {
        std::cerr << "Error: Cannot open output file '" << args.output_file << "'\n";
        return 1;
      }
    }
    std::ostream& out = file.is_open() ? static_cast<std::ostream&>(file) : std::cout;

    // Version command (no audio needed)
    if (args.command == "version") {
      return cmd_version(args, out);
    }

    const CommandInfo* cmd = find_command(args.command);
    if (!cmd) {
      std::cerr << "Error: Unknown command '" << args.command << "'\n\n";
      print_usage(argv[0]);
      return 1;
    }

    if (args.input_file.empty()) {
      std::cerr << "Error: Missing audio file\n\n";
      print_usage(argv[0]);
      return 1;
    }

    if (args.verbose()) {
      std::cerr << "Loading " << args.input_file << "...\n";
    }

    SampleBuffer buffer = load_input(args);

    if (args.verbose()) {
      std::cerr << "Loaded " << buffer.duration() << "s @ " << buffer.sample_rate() << "Hz, "
                << buffer.channels() << " channel(s)\n";
    }

    int status = cmd->handler(args, buffer, out);
    if (file.is_open() && args.verbose()) {
      std::cerr << "Wrote " << args.output_file << "\n";
    }
    return status;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
