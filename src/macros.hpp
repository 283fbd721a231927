#pragma once
/*
 * MacroTotals
 *
 * Purpose: running calories/carbs/fat/protein for the day.
 * Invariant: only grows; add_scaled is the single mutator and there is no removal.
 */
#include "food.hpp"

class MacroTotals {
public:
  double calories() const { return calories_; }
  double carbs() const { return carbs_; }
  double fat() const { return fat_; }
  double protein() const { return protein_; }

  void add_scaled(const FoodRecord& food, double quantity);

private:
  double calories_ = 0.0;
  double carbs_ = 0.0;
  double fat_ = 0.0;
  double protein_ = 0.0;
};

FoodRecord scaled(const FoodRecord& food, double quantity);
