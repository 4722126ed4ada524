#pragma once
#include "xa/annotation/Annotation.hpp"
#include "xa/ids/Id.hpp"
#include <cstddef>
#include <string>

namespace xa {

// Ordered annotation collection. Order is creation order and is also the
// hit-test priority order.
class AnnotationStore {
public:
  // Appends a copy of a. A kInvalidId id is replaced with a fresh one.
  // Returns the stored id.
  Id add(Annotation a);

  // Fresh id without inserting anything.
  Id allocateId() { return nextId_++; }

  bool remove(Id id);
  void clear();

  // Replace the whole collection (history restore, persistence load).
  void replaceAll(AnnotationList annotations);

  const Annotation* get(Id id) const;
  Annotation* getMutable(Id id);

  bool setLabel(Id id, const std::string& label);
  bool setLocked(Id id, bool locked);
  bool toggleLock(Id id);

  const AnnotationList& annotations() const { return annotations_; }
  std::size_t count() const { return annotations_.size(); }
  std::size_t countOfType(AnnotationType t) const;

  // "<Type> N" where N is one past the number of existing shapes of type t.
  std::string defaultLabel(AnnotationType t) const;

  // DTO codec: {"annotations":[{"id":"1","type":"box","points":[...],...}]}
  std::string toJSON() const;
  // Leaves the store untouched and returns false on any malformed entry.
  bool loadJSON(const std::string& json);

private:
  AnnotationList annotations_;
  Id nextId_{1};

  void bumpNextId();
};

// Stateless codec helpers shared with the session record.
std::string annotationsToJSON(const AnnotationList& list);
bool annotationsFromJSON(const std::string& json, AnnotationList& out);

} // namespace xa
