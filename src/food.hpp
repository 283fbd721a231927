#pragma once
/*
 * Food
 *
 * Purpose: food records, the tab-separated catalog line format, and catalog loading.
 * Line format: name \t calories \t carbs \t fat \t protein \t unit ; '#' starts a comment.
 * Policy: malformed lines are dropped (reason kept in msg), an unreadable file is fatal.
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct FoodRecord {
  std::string name;
  double calories = 0.0;
  double carbs = 0.0;
  double fat = 0.0;
  double protein = 0.0;
  std::string unit;
};

inline constexpr size_t kCatalogFieldCount = 6;

// whole-text, locale independent, finite and non-negative
bool parse_amount(std::string_view text, double& out);

bool parse_food_line(std::string_view line, FoodRecord& out, std::string& msg);
std::string format_food_line(const FoodRecord& f);

struct CatalogStats {
  size_t loaded = 0;
  size_t comments = 0;
  size_t dropped = 0;
};

// false only when the file itself cannot be read
bool load_catalog(const std::filesystem::path& path,
                  std::vector<FoodRecord>& out,
                  CatalogStats& stats,
                  std::string& msg);
