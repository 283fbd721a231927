#include "form.hpp"
#include "config.hpp"
#include "utf8.hpp"
#include <fmt/format.h>

const std::array<const char*, kFormFieldCount> kFormLabels = {
  "Food Name:",
  " Calories:",
  "  Protein:",
  "    Carbs:",
  "      Fat:",
  "    Units:",
  " Quantity:",
};

size_t FoodForm::capacity() { return MT_INPUT_WIDTH - 2; }

void FoodForm::sync_ledger() { typed_ = utf8_length(fields_[active_]); }

bool FoodForm::next_field() {
  if (active_ >= kFormFieldCount - 1) return false;
  active_++;
  sync_ledger();
  return true;
}

bool FoodForm::prev_field() {
  if (active_ <= 0) return false;
  active_--;
  sync_ledger();
  return true;
}

bool FoodForm::insert_text(const std::string& glyph) {
  if (glyph.empty()) return false;
  if (typed_ + utf8_length(glyph) > capacity()) return false;
  fields_[active_] += glyph;
  sync_ledger();
  return true;
}

bool FoodForm::backspace() {
  if (fields_[active_].empty()) return false;
  utf8_pop_back(fields_[active_]);
  sync_ledger();
  return true;
}

void FoodForm::reset() {
  for (auto& f : fields_) f.clear();
  active_ = 0;
  typed_ = 0;
}

static bool parse_field(const FormFields& fields, FormField which, const char* name, double& out, std::string& msg) {
  if (parse_amount(fields[which], out)) return true;
  msg = fmt::format("invalid {}: '{}'", name, fields[which]);
  return false;
}

bool parse_submission(const FormFields& fields, FoodEntry& out, std::string& msg) {
  FoodEntry e;
  e.food.name = fields[FieldName];
  if (!parse_field(fields, FieldCalories, "calories", e.food.calories, msg)) return false;
  if (!parse_field(fields, FieldCarbs, "carbs", e.food.carbs, msg)) return false;
  if (!parse_field(fields, FieldFat, "fat", e.food.fat, msg)) return false;
  if (!parse_field(fields, FieldProtein, "protein", e.food.protein, msg)) return false;
  e.food.unit = fields[FieldUnit];
  if (!parse_field(fields, FieldQuantity, "quantity", e.quantity, msg)) return false;
  out = std::move(e);
  return true;
}
