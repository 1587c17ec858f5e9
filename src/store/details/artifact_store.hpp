#ifndef SKULD_STORE_ARTIFACT_STORE_HPP
#define SKULD_STORE_ARTIFACT_STORE_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../common/error.hpp"
#include "../../common/save_load.hpp"
#include "../../encoding/encoding.hpp"
#include "../../model/model.hpp"
#include "backend.hpp"
#include "key.hpp"

namespace Skuld::Store::Details {
    enum class SaveMode {
        Create,     // refuse to overwrite an existing record
        Replace,
    };

    inline constexpr const char* kMetadataFile = "metadata.json";
    inline constexpr const char* kParametersFile = "parameters.binary";

    // Predictors keyed by (benchmark, hardware, schema). Loaded models are memoized per store instance.
    class ArtifactStore {
    public:
        explicit ArtifactStore(std::shared_ptr<StorageBackend> backend) : backend_(std::move(backend))
        {
            if (!backend_) {
                throw std::invalid_argument("ArtifactStore requires a storage backend.");
            }
        }

        explicit ArtifactStore(const std::filesystem::path& location)
            : ArtifactStore(std::make_shared<FilesystemBackend>(location)) {}

        [[nodiscard]] StorageBackend& backend() const noexcept { return *backend_; }

        [[nodiscard]] std::string location(const ArtifactKey& key) const
        {
            validate(key);
            return backend_->describe(key.relative_path());
        }

        [[nodiscard]] bool contains(const ArtifactKey& key) const
        {
            validate(key);
            return backend_->exists(file(key, kMetadataFile));
        }

        // Parameters go first and metadata last, so a record is visible only once complete.
        void save(const ArtifactKey& key, std::shared_ptr<const Model::PredictorModel> model, SaveMode mode = SaveMode::Create)
        {
            validate(key);
            if (!model) {
                throw std::invalid_argument("Cannot save a null predictor under " + key.to_string() + ".");
            }
            if (model->schema_version() != key.schema_version) {
                throw std::invalid_argument("Predictor schema '" + model->schema_version()
                                            + "' does not match the key " + key.to_string() + ".");
            }
            if (mode == SaveMode::Create && contains(key)) {
                throw Error::DestinationConflict(location(key));
            }

            write_record(key, *model);

            std::lock_guard<std::mutex> guard(mutex_);
            memo_[key] = std::move(model);
        }

        // Epoch-boundary snapshot of a model that is still training. Replaces the record and is never memoized.
        void checkpoint(const ArtifactKey& key, const Model::PredictorModel& model)
        {
            validate(key);
            write_record(key, model);
            forget(key);
        }

        // Empty when no record exists. Incompatible records raise SchemaMismatch, damaged ones ArtifactCorrupted.
        [[nodiscard]] std::optional<std::shared_ptr<const Model::PredictorModel>> load(const ArtifactKey& key)
        {
            validate(key);
            {
                std::lock_guard<std::mutex> guard(mutex_);
                const auto found = memo_.find(key);
                if (found != memo_.end()) {
                    return found->second;
                }
            }

            auto restored = restore(key);
            if (!restored) {
                return std::nullopt;
            }
            std::shared_ptr<const Model::PredictorModel> shared = std::move(restored);

            std::lock_guard<std::mutex> guard(mutex_);
            return memo_.emplace(key, shared).first->second;
        }

        // Fresh, mutable copy of a stored predictor, bypassing the memo. Used for warm starts.
        [[nodiscard]] std::unique_ptr<Model::PredictorModel> restore(const ArtifactKey& key) const
        {
            validate(key);
            const auto context = "artifact " + key.to_string() + " at '" + location(key) + "'";
            const auto expected_schema = Encoding::GraphEncoder::schema_version();
            if (key.schema_version != expected_schema) {
                if (!contains(key)) {
                    return nullptr;
                }
                throw Error::SchemaMismatch(context, expected_schema, key.schema_version);
            }

            const auto metadata_text = backend_->read(file(key, kMetadataFile));
            if (!metadata_text) {
                return nullptr;
            }
            const auto parameters = backend_->read(file(key, kParametersFile));
            if (!parameters) {
                throw Error::ArtifactCorrupted(context + " has metadata but no " + kParametersFile + ".");
            }

            Common::SaveLoad::PropertyTree metadata;
            try {
                metadata = Common::SaveLoad::from_json_string(*metadata_text, context);
            } catch (const std::runtime_error& error) {
                throw Error::ArtifactCorrupted(error.what());
            }
            const auto benchmark = metadata.get<std::string>("benchmark", "");
            const auto hardware = metadata.get<std::string>("hardware_signature", "");
            if (benchmark != key.benchmark || hardware != key.hardware_signature) {
                throw Error::ArtifactCorrupted(context + " describes (" + benchmark + ", " + hardware + ").");
            }
            return Model::PredictorModel::restore(metadata, *parameters, context);
        }

        bool remove(const ArtifactKey& key)
        {
            validate(key);
            {
                std::lock_guard<std::mutex> guard(mutex_);
                memo_.erase(key);
            }
            const auto metadata_removed = backend_->remove(file(key, kMetadataFile));
            const auto parameters_removed = backend_->remove(file(key, kParametersFile));
            return metadata_removed || parameters_removed;
        }

        [[nodiscard]] std::vector<ArtifactKey> keys() const
        {
            std::vector<ArtifactKey> found;
            const std::string suffix = std::string("/") + kMetadataFile;
            for (const auto& path : backend_->list()) {
                if (path.size() <= suffix.size() || path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
                    continue;
                }
                std::vector<std::string> parts;
                std::stringstream stream(path.substr(0, path.size() - suffix.size()));
                std::string part;
                while (std::getline(stream, part, '/')) {
                    parts.push_back(part);
                }
                if (parts.size() == 3) {
                    found.push_back(ArtifactKey{parts[0], parts[1], parts[2]});
                }
            }
            return found;
        }

        // Side files kept beside a record (measurement cache, corpus).
        [[nodiscard]] std::optional<std::string> read_attachment(const ArtifactKey& key, const std::string& name) const
        {
            validate(key);
            return backend_->read(file(key, name));
        }

        void write_attachment(const ArtifactKey& key, const std::string& name, const std::string& bytes)
        {
            validate(key);
            backend_->write(file(key, name), bytes);
        }

        bool remove_attachment(const ArtifactKey& key, const std::string& name)
        {
            validate(key);
            return backend_->remove(file(key, name));
        }

        // Exclusive advisory lock over the key, held by training runs while they persist.
        [[nodiscard]] std::unique_ptr<KeyLock> lock(const ArtifactKey& key)
        {
            validate(key);
            return backend_->lock(key.relative_path());
        }

        void forget(const ArtifactKey& key)
        {
            std::lock_guard<std::mutex> guard(mutex_);
            memo_.erase(key);
        }

    private:
        void write_record(const ArtifactKey& key, const Model::PredictorModel& model)
        {
            auto metadata = model.metadata();
            metadata.put("benchmark", key.benchmark);
            metadata.put("hardware_signature", key.hardware_signature);

            backend_->write(file(key, kParametersFile), model.serialize_parameters());
            backend_->write(file(key, kMetadataFile), Common::SaveLoad::to_json_string(metadata));
        }

        static std::string file(const ArtifactKey& key, const std::string& name)
        {
            return key.relative_path() + "/" + name;
        }

        std::shared_ptr<StorageBackend> backend_;
        mutable std::mutex mutex_{};
        std::map<ArtifactKey, std::shared_ptr<const Model::PredictorModel>> memo_{};
    };
}

#endif // SKULD_STORE_ARTIFACT_STORE_HPP
