#pragma once

#include "mapprep/core/types.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace mapprep::split {

struct SplitOptions {
  std::string output_format = "png";
};

// One written division: file plus its placement in the source image.
struct SplitOutput {
  fs::path path;
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

// Cutlines drawn on a document and the divisions derived from them.
struct Segmentation {
  std::vector<Cutline> cutlines;
  std::vector<Division> divisions;
  bool split_needed = true;
};

nlohmann::json rings_to_json(const std::vector<Ring>& rings);
std::vector<Ring> rings_from_json(const nlohmann::json& j);
nlohmann::json segmentation_to_json(const Segmentation& seg);
Segmentation segmentation_from_json(const nlohmann::json& j);

class Splitter {
public:
  explicit Splitter(SplitOptions options = {});

  /**
   * Partition the image rectangle by the cutlines. Divisions come back in
   * reading order: top to bottom, then left to right by bounding box origin.
   * Zero cutlines yield the single full-image division.
   */
  std::vector<Division> generate_divisions(const std::vector<Cutline>& cutlines,
                                           const ImageBounds& bounds) const;

  std::vector<Division> preview(const fs::path& image,
                                const std::vector<Cutline>& cutlines) const;

  // Writes one image per division, cropped to its pixel extent, with
  // pixels outside the division fully transparent.
  std::vector<SplitOutput> split_image(const fs::path& source,
                                       const std::vector<Division>& divisions,
                                       const fs::path& out_dir) const;

  static ImageBounds read_bounds(const fs::path& image);

  // Owning division index for each pixel of a row. Every pixel gets exactly one owner.
  static std::vector<int> label_row(const std::vector<Division>& divisions, int row, int width);

private:
  SplitOptions options_;
};

} // namespace mapprep::split
