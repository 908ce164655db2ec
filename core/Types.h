#pragma once

struct IntSize {
  int width = 0;
  int height = 0;
};
