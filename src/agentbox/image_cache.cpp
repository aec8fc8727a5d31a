#include <agentbox/container_runtime.h>

bool ImageCache::IsReady(const std::string& image) const {
  std::lock_guard lck(mtx_);
  return ready_.count(image);
}

void ImageCache::MarkReady(const std::string& image) {
  std::lock_guard lck(mtx_);
  ready_.insert(image);
}

void ImageCache::Invalidate(const std::string& image) {
  std::lock_guard lck(mtx_);
  ready_.erase(image);
}

void ImageCache::RecordBuild() {
  std::lock_guard lck(mtx_);
  builds_++;
}
void ImageCache::RecordProbe() {
  std::lock_guard lck(mtx_);
  probes_++;
}
void ImageCache::RecordRun() {
  std::lock_guard lck(mtx_);
  runs_++;
}

long ImageCache::Builds() const {
  std::lock_guard lck(mtx_);
  return builds_;
}
long ImageCache::Probes() const {
  std::lock_guard lck(mtx_);
  return probes_;
}
long ImageCache::Runs() const {
  std::lock_guard lck(mtx_);
  return runs_;
}
