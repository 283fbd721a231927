#include "macros.hpp"

FoodRecord scaled(const FoodRecord& food, double quantity) {
  FoodRecord r = food;
  r.calories *= quantity;
  r.carbs *= quantity;
  r.fat *= quantity;
  r.protein *= quantity;
  return r;
}

void MacroTotals::add_scaled(const FoodRecord& food, double quantity) {
  // totals never decrease; zero or negative quantities add nothing
  if (!(quantity > 0.0)) return;
  FoodRecord r = scaled(food, quantity);
  calories_ += r.calories;
  carbs_ += r.carbs;
  fat_ += r.fat;
  protein_ += r.protein;
}
