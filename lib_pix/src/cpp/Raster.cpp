#include "Raster.hpp"

#include <sstream>

using namespace pix;

Raster::Raster(std::shared_ptr<const SampleLayout> layout,
               std::shared_ptr<PixelBuffer> buffer, const Rect &bounds,
               const Point &translate, std::shared_ptr<Raster> parent)
    : layout(std::move(layout)),
      buffer(std::move(buffer)),
      bounds(bounds),
      translate(translate),
      parent(parent) {
  if (!this->layout) throw InvalidArgument("Raster requires a sample layout");
  if (!this->buffer) throw InvalidArgument("Raster requires a pixel buffer");

  if (bounds.IsEmpty()) {
    std::stringstream msg;
    msg << "Raster bounds " << bounds << " must have positive width and height";
    throw InvalidArgument(msg.str());
  }

  if (this->buffer->Type() != this->layout->Type()) {
    std::stringstream msg;
    msg << "Pixel buffer type " << this->buffer->Type()
        << " does not match layout type " << this->layout->Type();
    throw InvalidArgument(msg.str());
  }

  const Rect layout_rect(translate.x, translate.y, this->layout->Width(),
                         this->layout->Height());
  if (!layout_rect.Contains(bounds)) {
    std::stringstream msg;
    msg << "Raster bounds " << bounds << " lie outside its layout "
        << layout_rect;
    throw FormatError(msg.str());
  }
}

std::shared_ptr<Raster> Raster::Create(
    std::shared_ptr<const SampleLayout> layout, const Point &origin) {
  if (!layout) throw InvalidArgument("Raster requires a sample layout");
  auto buffer = layout->CreatePixelBuffer();
  return Create(std::move(layout), std::move(buffer), origin);
}

std::shared_ptr<Raster> Raster::Create(
    std::shared_ptr<const SampleLayout> layout,
    std::shared_ptr<PixelBuffer> buffer, const Point &origin) {
  if (!layout) throw InvalidArgument("Raster requires a sample layout");
  const Rect bounds(origin.x, origin.y, layout->Width(), layout->Height());
  return Create(std::move(layout), std::move(buffer), bounds, origin);
}

std::shared_ptr<Raster> Raster::Create(
    std::shared_ptr<const SampleLayout> layout,
    std::shared_ptr<PixelBuffer> buffer, const Rect &bounds,
    const Point &translate, std::shared_ptr<Raster> parent) {
  return std::shared_ptr<Raster>(new Raster(std::move(layout),
                                            std::move(buffer), bounds,
                                            translate, std::move(parent)));
}

/////////////////////////////////////////////////////////////////
//                    Reading
/////////////////////////////////////////////////////////////////
int Raster::GetSample(int x, int y, int b) const {
  return layout->GetSample(x - translate.x, y - translate.y, b, *buffer);
}

float Raster::GetSampleFloat(int x, int y, int b) const {
  return layout->GetSampleFloat(x - translate.x, y - translate.y, b, *buffer);
}

double Raster::GetSampleDouble(int x, int y, int b) const {
  return layout->GetSampleDouble(x - translate.x, y - translate.y, b, *buffer);
}

void Raster::GetSamples(int x, int y, int w, int h, int b,
                        int32_t *samples) const {
  layout->GetSamples(x - translate.x, y - translate.y, w, h, b, samples,
                     *buffer);
}

void Raster::GetSamples(int x, int y, int w, int h, int b,
                        float *samples) const {
  layout->GetSamples(x - translate.x, y - translate.y, w, h, b, samples,
                     *buffer);
}

void Raster::GetSamples(int x, int y, int w, int h, int b,
                        double *samples) const {
  layout->GetSamples(x - translate.x, y - translate.y, w, h, b, samples,
                     *buffer);
}

std::vector<int32_t> Raster::GetSamples(int x, int y, int w, int h,
                                        int b) const {
  return layout->GetSamples(x - translate.x, y - translate.y, w, h, b,
                            *buffer);
}

void Raster::GetPixel(int x, int y, int32_t *pixel) const {
  layout->GetPixel(x - translate.x, y - translate.y, pixel, *buffer);
}

void Raster::GetPixel(int x, int y, float *pixel) const {
  layout->GetPixel(x - translate.x, y - translate.y, pixel, *buffer);
}

void Raster::GetPixel(int x, int y, double *pixel) const {
  layout->GetPixel(x - translate.x, y - translate.y, pixel, *buffer);
}

std::vector<int32_t> Raster::GetPixel(int x, int y) const {
  return layout->GetPixel(x - translate.x, y - translate.y, *buffer);
}

void Raster::GetPixels(int x, int y, int w, int h, int32_t *pixels) const {
  layout->GetPixels(x - translate.x, y - translate.y, w, h, pixels, *buffer);
}

void Raster::GetPixels(int x, int y, int w, int h, float *pixels) const {
  layout->GetPixels(x - translate.x, y - translate.y, w, h, pixels, *buffer);
}

void Raster::GetPixels(int x, int y, int w, int h, double *pixels) const {
  layout->GetPixels(x - translate.x, y - translate.y, w, h, pixels, *buffer);
}

std::vector<int32_t> Raster::GetPixels(int x, int y, int w, int h) const {
  return layout->GetPixels(x - translate.x, y - translate.y, w, h, *buffer);
}

void Raster::GetDataElements(int x, int y, TransferArray &out) const {
  layout->GetDataElements(x - translate.x, y - translate.y, out, *buffer);
}

void Raster::GetDataElements(int x, int y, int w, int h,
                             TransferArray &out) const {
  layout->GetDataElements(x - translate.x, y - translate.y, w, h, out,
                          *buffer);
}

/////////////////////////////////////////////////////////////////
//                    Writing
/////////////////////////////////////////////////////////////////
void Raster::SetSample(int x, int y, int b, int s) {
  layout->SetSample(x - translate.x, y - translate.y, b, s, *buffer);
}

void Raster::SetSample(int x, int y, int b, float s) {
  layout->SetSample(x - translate.x, y - translate.y, b, s, *buffer);
}

void Raster::SetSample(int x, int y, int b, double s) {
  layout->SetSample(x - translate.x, y - translate.y, b, s, *buffer);
}

void Raster::SetSamples(int x, int y, int w, int h, int b,
                        const int32_t *samples) {
  layout->SetSamples(x - translate.x, y - translate.y, w, h, b, samples,
                     *buffer);
}

void Raster::SetSamples(int x, int y, int w, int h, int b,
                        const float *samples) {
  layout->SetSamples(x - translate.x, y - translate.y, w, h, b, samples,
                     *buffer);
}

void Raster::SetSamples(int x, int y, int w, int h, int b,
                        const double *samples) {
  layout->SetSamples(x - translate.x, y - translate.y, w, h, b, samples,
                     *buffer);
}

void Raster::SetPixel(int x, int y, const int32_t *pixel) {
  layout->SetPixel(x - translate.x, y - translate.y, pixel, *buffer);
}

void Raster::SetPixel(int x, int y, const float *pixel) {
  layout->SetPixel(x - translate.x, y - translate.y, pixel, *buffer);
}

void Raster::SetPixel(int x, int y, const double *pixel) {
  layout->SetPixel(x - translate.x, y - translate.y, pixel, *buffer);
}

void Raster::SetPixels(int x, int y, int w, int h, const int32_t *pixels) {
  layout->SetPixels(x - translate.x, y - translate.y, w, h, pixels, *buffer);
}

void Raster::SetPixels(int x, int y, int w, int h, const float *pixels) {
  layout->SetPixels(x - translate.x, y - translate.y, w, h, pixels, *buffer);
}

void Raster::SetPixels(int x, int y, int w, int h, const double *pixels) {
  layout->SetPixels(x - translate.x, y - translate.y, w, h, pixels, *buffer);
}

void Raster::SetDataElements(int x, int y, const TransferArray &in) {
  layout->SetDataElements(x - translate.x, y - translate.y, in, *buffer);
}

void Raster::SetDataElements(int x, int y, int w, int h,
                             const TransferArray &in) {
  layout->SetDataElements(x - translate.x, y - translate.y, w, h, in,
                          *buffer);
}

void Raster::SetDataElements(int x, int y, const Raster &src) {
  if (src.TransferType() != TransferType() ||
      src.NumDataElements() != NumDataElements()) {
    std::stringstream msg;
    msg << "Cannot copy data elements from a raster with " << src.TransferType()
        << "x" << src.NumDataElements() << " elements per pixel into one with "
        << TransferType() << "x" << NumDataElements();
    throw InvalidArgument(msg.str());
  }

  const Rect dst_rect = src.Bounds().Translate(x, y).Intersection(bounds);
  if (dst_rect.IsEmpty()) return;

  const int src_x = dst_rect.x - x;
  const int src_y = dst_rect.y - y;

  TransferArray row;
  for (int r = 0; r < dst_rect.height; ++r) {
    src.GetDataElements(src_x, src_y + r, dst_rect.width, 1, row);
    SetDataElements(dst_rect.x, dst_rect.y + r, dst_rect.width, 1, row);
  }
}

void Raster::SetRect(int dx, int dy, const Raster &src) {
  if (src.NumBands() != NumBands())
    throw MismatchedBands("Cannot copy " + std::to_string(src.NumBands()) +
                          " bands into a raster with " +
                          std::to_string(NumBands()) + " bands");

  const Rect dst_rect = src.Bounds().Translate(dx, dy).Intersection(bounds);
  if (dst_rect.IsEmpty()) return;

  const int src_x = dst_rect.x - dx;
  const int src_y = dst_rect.y - dy;

  std::vector<int32_t> row(dst_rect.width * NumBands());
  for (int r = 0; r < dst_rect.height; ++r) {
    src.GetPixels(src_x, src_y + r, dst_rect.width, 1, row.data());
    SetPixels(dst_rect.x, dst_rect.y + r, dst_rect.width, 1, row.data());
  }
}

/////////////////////////////////////////////////////////////////
//                    Factories
/////////////////////////////////////////////////////////////////
std::shared_ptr<Raster> Raster::CreateChild(int parent_x, int parent_y, int w,
                                            int h, int child_min_x,
                                            int child_min_y,
                                            const std::vector<int> *band_list) {
  if (parent_x < bounds.x)
    throw FormatError("parent_x lies outside raster");
  if (parent_y < bounds.y)
    throw FormatError("parent_y lies outside raster");
  if (parent_x + w > bounds.MaxX())
    throw FormatError("(parent_x + width) is outside raster");
  if (parent_y + h > bounds.MaxY())
    throw FormatError("(parent_y + height) is outside raster");

  std::shared_ptr<const SampleLayout> child_layout = layout;
  if (band_list != nullptr) {
    auto compatible =
        layout->CreateCompatibleSampleLayout(layout->Width(), layout->Height());
    child_layout = compatible->CreateSubsetSampleLayout(*band_list);
  }

  const int delta_x = child_min_x - parent_x;
  const int delta_y = child_min_y - parent_y;

  return Create(child_layout, buffer, Rect(child_min_x, child_min_y, w, h),
                Point(translate.x + delta_x, translate.y + delta_y),
                shared_from_this());
}

std::shared_ptr<Raster> Raster::CreateTranslatedChild(int child_min_x,
                                                      int child_min_y) {
  return CreateChild(bounds.x, bounds.y, bounds.width, bounds.height,
                     child_min_x, child_min_y);
}

std::shared_ptr<Raster> Raster::CreateCompatibleRaster() const {
  return CreateCompatibleRaster(bounds.x, bounds.y, bounds.width,
                                bounds.height);
}

std::shared_ptr<Raster> Raster::CreateCompatibleRaster(int w, int h) const {
  return CreateCompatibleRaster(0, 0, w, h);
}

std::shared_ptr<Raster> Raster::CreateCompatibleRaster(int x, int y, int w,
                                                       int h) const {
  auto compatible = layout->CreateCompatibleSampleLayout(w, h);
  return Create(std::move(compatible), Point(x, y));
}
