#pragma once
/*
 * FoodForm
 *
 * Purpose: state of the add-food form: seven text fields, the active field and
 *          the cursor ledger (code points typed in the active field).
 * Invariant: active() stays in [0, kFormFieldCount); field changes never wrap.
 * Ledger: recomputed from the active buffer after every change, never patched.
 */
#include <array>
#include <string>
#include "food.hpp"

enum FormField { FieldName, FieldCalories, FieldProtein, FieldCarbs, FieldFat, FieldUnit, FieldQuantity };

inline constexpr int kFormFieldCount = 7;

// right-aligned to MT_LABEL_WIDTH
extern const std::array<const char*, kFormFieldCount> kFormLabels;

using FormFields = std::array<std::string, kFormFieldCount>;

struct FoodEntry {
  FoodRecord food;
  double quantity = 0.0;
};

class FoodForm {
public:
  int active() const { return active_; }
  const std::string& field(int i) const { return fields_[i]; }
  const FormFields& fields() const { return fields_; }
  size_t typed() const { return typed_; }

  bool next_field();
  bool prev_field();
  bool insert_text(const std::string& glyph);
  bool backspace();
  void reset();

  static size_t capacity();

private:
  void sync_ledger();

  FormFields fields_;
  int active_ = 0;
  size_t typed_ = 0;
};

bool parse_submission(const FormFields& fields, FoodEntry& out, std::string& msg);
