/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * Engine registry: engine construction by id, credential resolution and
 * fallback chains.
 */

#ifndef HERALD_ENGINE_REGISTRY_H
#define HERALD_ENGINE_REGISTRY_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/herald_config.h"
#include "core/pipeline_config.h"
#include "tts/tts_engine.h"

namespace herald {

/**
 * All known engine ids in registration order.
 */
const std::vector<std::string> &engine_ids();

bool is_known_engine(const std::string &engine_id);

/**
 * Engines to try, in order, after engine_id fails.
 */
const std::vector<std::string> &fallback_chain(const std::string &engine_id);

/**
 * Candidate credential setting keys for an engine, highest priority first.
 */
std::vector<std::string> credential_keys_for(const std::string &engine_id);

/**
 * First candidate whose value is non-empty after trimming, trimmed.
 * Returns an empty string when no candidate is usable.
 */
std::string resolve_credential(const std::vector<std::string> &keys,
                               const std::function<std::string(const std::string &)> &lookup);

/**
 * Construct one adapter.
 * @throws TtsError HERALD_ERR_NOT_FOUND for an unknown id,
 *         HERALD_ERR_INVALID_CREDENTIAL for an empty credential
 */
std::shared_ptr<TtsEngine> create_engine(const std::string &engine_id,
                                         const std::string &credential,
                                         const EngineSettings &settings,
                                         std::shared_ptr<HttpClient> http = nullptr);

/**
 * Adapter settings derived from a configuration snapshot.
 */
EngineSettings engine_settings_from(const PipelineConfig &config);

/**
 * Set of constructed adapters keyed by id.
 *
 * The set is swapped wholesale on credential rotation; get() hands out
 * shared pointers so an adapter stays alive for calls already in flight.
 */
class EngineRegistry {
 public:
   using EngineMap = std::map<std::string, std::shared_ptr<TtsEngine>>;

   EngineRegistry() : engines_(std::make_shared<EngineMap>()) {}

   /**
    * Build every engine with a usable credential. Engines without one are
    * skipped (logged); a construction error for one engine never stops the
    * others.
    *
    * @return Number of engines available afterwards
    */
   size_t load(const PipelineConfig &config,
               const secrets_config_t &secrets,
               std::shared_ptr<HttpClient> http = nullptr);

   /**
    * Add or replace one adapter.
    */
   void put(std::shared_ptr<TtsEngine> engine);

   std::shared_ptr<TtsEngine> get(const std::string &engine_id) const;
   bool has(const std::string &engine_id) const { return get(engine_id) != nullptr; }
   std::vector<std::string> available() const;

 private:
   mutable std::mutex mutex_;
   std::shared_ptr<const EngineMap> engines_;
};

}  // namespace herald

#endif  // HERALD_ENGINE_REGISTRY_H
