#pragma once

#include "mapprep/config/configuration.hpp"
#include "mapprep/georeference/georeferencer.hpp"
#include "mapprep/session/engine.hpp"
#include "mapprep/trim/mask.hpp"

#include <string>
#include <vector>

namespace mapprep::session {

/**
 * Session operations backed by the raster modules: preparation splits the
 * document into child subjects, georeference writes the final GeoTIFF as
 * a derived layer, trim writes the masked copy of a layer.
 */
class RasterOperations : public SessionOperations {
public:
  RasterOperations(const config::Config& cfg, const fs::path& base_dir,
                   ResourceGateway& gateway, const StatusVocabulary& vocabulary);

  RunResult run(const Session& session) override;
  void undo(const Session& session) override;
  ImageBounds image_bounds(const std::string& subject_ref) override;

  georeference::GeoreferenceOptions georeference_options() const;
  trim::MaskOptions mask_options() const;

private:
  RunResult run_preparation(const Session& s, const PreparationData& d);
  RunResult run_georeference(const Session& s, const GeoreferenceData& d);
  RunResult run_trim(const Session& s, const TrimData& d);

  void discard_subjects(const std::vector<std::string>& refs);

  const config::Config& cfg_;
  fs::path base_dir_;
  ResourceGateway& gateway_;
  const StatusVocabulary& vocabulary_;
};

} // namespace mapprep::session
