#include "food.hpp"
#include "file_reader.hpp"
#include "log.hpp"
#include <charconv>
#include <cmath>
#include <fmt/format.h>

bool parse_amount(std::string_view text, double& out) {
  // from_chars has no '+' sign of its own
  if (!text.empty() && text[0] == '+') text.remove_prefix(1);
  if (text.empty()) return false;
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc() || ptr != text.data() + text.size()) return false;
  if (!std::isfinite(v) || v < 0.0) return false;
  out = v;
  return true;
}

static std::vector<std::string_view> split_tabs(std::string_view line) {
  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    size_t pos = line.find('\t', start);
    if (pos == std::string_view::npos) { fields.push_back(line.substr(start)); break; }
    fields.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

static bool parse_named(std::string_view name, std::string_view text, double& out, std::string& msg) {
  if (parse_amount(text, out)) return true;
  msg = fmt::format("invalid {}: '{}'", name, text);
  return false;
}

bool parse_food_line(std::string_view line, FoodRecord& out, std::string& msg) {
  if (!line.empty() && line[0] == '#') { msg = "comment"; return false; }
  auto fields = split_tabs(line);
  if (fields.size() != kCatalogFieldCount) {
    msg = fmt::format("invalid field number: {}", fields.size());
    return false;
  }
  FoodRecord f;
  f.name = std::string(fields[0]);
  if (!parse_named("calories", fields[1], f.calories, msg)) return false;
  if (!parse_named("carbs", fields[2], f.carbs, msg)) return false;
  if (!parse_named("fat", fields[3], f.fat, msg)) return false;
  if (!parse_named("protein", fields[4], f.protein, msg)) return false;
  f.unit = std::string(fields[5]);
  out = std::move(f);
  return true;
}

std::string format_food_line(const FoodRecord& f) {
  return fmt::format("{}\t{}\t{}\t{}\t{}\t{}", f.name, f.calories, f.carbs, f.fat, f.protein, f.unit);
}

bool load_catalog(const std::filesystem::path& path,
                  std::vector<FoodRecord>& out,
                  CatalogStats& stats,
                  std::string& msg) {
  out.clear();
  stats = CatalogStats{};
  std::vector<std::string> lines;
  if (!mmapReadLines(path, lines, msg)) return false;
  for (size_t i = 0; i < lines.size(); ++i) {
    FoodRecord f;
    std::string why;
    if (parse_food_line(lines[i], f, why)) {
      out.push_back(std::move(f));
      stats.loaded++;
    } else if (why == "comment") {
      stats.comments++;
    } else {
      stats.dropped++;
      LOG_DEBUG("{}:{}: dropped line ({})", path.string(), i + 1, why);
    }
  }
  if (stats.dropped > 0) LOG_WARN("{}: {} malformed lines dropped", path.string(), stats.dropped);
  msg = fmt::format("loaded {} foods from {} ({} dropped)", stats.loaded, path.string(), stats.dropped);
  return true;
}
