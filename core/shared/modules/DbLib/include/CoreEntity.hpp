#ifndef DBLIB_CORE_ENTITY_HPP
#define DBLIB_CORE_ENTITY_HPP

#include "DbExport.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace DbLib {

/**
 * @brief Generic Entity State
 */
enum class EntityState { NEW, LOADED, MODIFIED, DELETED };

/**
 * @brief Base class for all entities in DbLib
 * @tparam DerivedType CRTP for type-safe operations if needed
 */
template <typename DerivedType> class CoreEntity {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  CoreEntity()
      : id_(0), state_(EntityState::NEW),
        created_at_(std::chrono::system_clock::now()),
        updated_at_(created_at_) {}

  explicit CoreEntity(int64_t id) : CoreEntity() {
    id_ = id;
    if (id > 0)
      state_ = EntityState::LOADED;
  }

  virtual ~CoreEntity() = default;

  // Accessors
  int64_t getId() const { return id_; }
  void setId(int64_t id) { id_ = id; }

  EntityState getState() const { return state_; }
  TimePoint getCreatedAt() const { return created_at_; }
  TimePoint getUpdatedAt() const { return updated_at_; }
  void setCreatedAt(TimePoint tp) { created_at_ = tp; }
  void setUpdatedAt(TimePoint tp) { updated_at_ = tp; }

  // State Management
  bool isLoaded() const { return state_ == EntityState::LOADED; }
  bool isNew() const { return state_ == EntityState::NEW; }
  bool isModified() const { return state_ == EntityState::MODIFIED; }
  bool isDeleted() const { return state_ == EntityState::DELETED; }

  void markModified() {
    if (state_ == EntityState::LOADED)
      state_ = EntityState::MODIFIED;
  }

  void markDeleted() { state_ = EntityState::DELETED; }

  /**
   * @brief Called by repositories once the row is persisted
   */
  void markSaved(int64_t id, TimePoint when) {
    id_ = id;
    if (state_ == EntityState::NEW)
      created_at_ = when;
    updated_at_ = when;
    state_ = EntityState::LOADED;
  }

protected:
  int64_t id_;
  EntityState state_;
  TimePoint created_at_;
  TimePoint updated_at_;
};

} // namespace DbLib

#endif // DBLIB_CORE_ENTITY_HPP
