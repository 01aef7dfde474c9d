#include "ConvolutionFilter.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

#include "ComponentSampleLayout.hpp"
#include "Errors.hpp"

using namespace pix;

ConvolutionFilter::ConvolutionFilter(const Kernel &kernel,
                                     const ConvolveParams &params)
    : kernel(kernel), params(params) {}

void ConvolutionFilter::Convolve(const Raster &src, Raster &dst) const {
  if (params.accelerated) {
    try {
      if (params.accelerated->Convolve(kernel, params.edge_condition, src,
                                       dst)) {
        if (params.verbose)
          printf("convolve: %s backend\n", params.accelerated->Name());
        return;
      }
      if (params.verbose)
        printf("convolve: %s backend declined\n", params.accelerated->Name());
    } catch (const OperationFailed &e) {
      if (params.verbose)
        printf("convolve: %s backend failed: %s\n",
               params.accelerated->Name(), e.what());
    }
  }

  if (params.fallback &&
      params.fallback->Convolve(kernel, params.edge_condition, src, dst)) {
    if (params.verbose)
      printf("convolve: %s backend\n", params.fallback->Name());
    return;
  }

  throw OperationFailed("No filter backend could convolve a " +
                        std::to_string(src.Width()) + "x" +
                        std::to_string(src.Height()) + " raster");
}

std::shared_ptr<Raster> ConvolutionFilter::Filter(
    const Raster &src, std::shared_ptr<Raster> dst) const {
  if (&src == dst.get())
    throw InvalidArgument("Source and destination rasters must differ");

  if (!dst) {
    dst = CreateCompatibleDestRaster(src);
  } else if (dst->NumBands() != src.NumBands()) {
    throw MismatchedBands("Source has " + std::to_string(src.NumBands()) +
                          " bands, destination has " +
                          std::to_string(dst->NumBands()));
  }

  Convolve(src, *dst);
  return dst;
}

std::shared_ptr<ColorImage> ConvolutionFilter::Filter(
    const ColorImage &src, std::shared_ptr<ColorImage> dst) const {
  if (dst && (&src == dst.get() || src.GetRaster() == dst->GetRaster()))
    throw InvalidArgument("Source and destination images must differ");

  if (!dst) dst = CreateCompatibleDestImage(src);

  const ColorModel &src_model = src.Model();
  const ColorModel &dst_model = dst->Model();

  const bool premultiply =
      src_model.HasAlpha() && !src_model.IsAlphaPremultiplied();

  if (src_model == dst_model && !premultiply) {
    Filter(*src.GetRaster(), dst->GetRaster());
    return dst;
  }

  ColorImage work = src;
  if (premultiply) {
    if (params.verbose)
      printf("convolve: premultiplying %d band source\n", src.NumBands());
    work = src.CoerceData(true);
  }

  ColorImage result(work.Model(), Filter(*work.GetRaster()));

  if (src_model.ColorSpace() != dst_model.ColorSpace()) {
    if (!params.color_converter)
      throw OperationFailed("No colour converter configured to convert " +
                            std::to_string(src_model.NumColorComponents()) +
                            " component source to destination colour space");
    const bool dst_premultiplied =
        dst_model.HasAlpha() && dst_model.IsAlphaPremultiplied();
    if (result.Model().IsAlphaPremultiplied() && !dst_premultiplied) {
      if (params.verbose) printf("convolve: dividing out alpha\n");
      result = result.CoerceData(false);
    }
    if (params.verbose) printf("convolve: converting colour space\n");
    params.color_converter->Convert(result, *dst, params.hints);
    return dst;
  }

  WriteResult(result, *dst);
  return dst;
}

void ConvolutionFilter::WriteResult(const ColorImage &result,
                                    ColorImage &dst) const {
  const ColorModel &res_model = result.Model();
  const ColorModel &dst_model = dst.Model();

  const int colors = res_model.NumColorComponents();
  if (dst_model.NumColorComponents() != colors)
    throw MismatchedBands("Result has " + std::to_string(colors) +
                          " colour components, destination has " +
                          std::to_string(dst_model.NumColorComponents()));

  Raster &res_raster = *result.GetRaster();
  Raster &dst_raster = *dst.GetRaster();

  if (res_model.HasAlpha() && res_model.IsAlphaPremultiplied() &&
      !(dst_model.HasAlpha() && dst_model.IsAlphaPremultiplied())) {
    if (params.verbose) printf("convolve: dividing out alpha\n");
    DivideAlpha(res_raster, res_model.AlphaBand());
  }

  const int res_bands = res_raster.NumBands();
  const int dst_bands = dst_raster.NumBands();
  const int alpha_fill =
      dst_model.HasAlpha()
          ? RangeOf(*dst_raster.Layout(), dst_model.AlphaBand()).max
          : 0;

  const int w = std::min(res_raster.Width(), dst_raster.Width());
  const int h = std::min(res_raster.Height(), dst_raster.Height());

  std::vector<int32_t> in(w * res_bands);
  std::vector<int32_t> out(w * dst_bands);

  for (int y = 0; y < h; ++y) {
    res_raster.GetPixels(res_raster.MinX(), res_raster.MinY() + y, w, 1,
                         in.data());

    for (int x = 0; x < w; ++x) {
      const int32_t *src_pix = &in[x * res_bands];
      int32_t *dst_pix = &out[x * dst_bands];

      for (int b = 0; b < colors; ++b) dst_pix[b] = src_pix[b];
      if (dst_model.HasAlpha())
        dst_pix[colors] = res_model.HasAlpha() ? src_pix[colors] : alpha_fill;
    }

    dst_raster.SetPixels(dst_raster.MinX(), dst_raster.MinY() + y, w, 1,
                         out.data());
  }
}

std::shared_ptr<Raster> ConvolutionFilter::CreateCompatibleDestRaster(
    const Raster &src) const {
  return src.CreateCompatibleRaster();
}

std::shared_ptr<ColorImage> ConvolutionFilter::CreateCompatibleDestImage(
    const ColorImage &src, const ColorModel *dst_model) const {
  const ColorModel model = dst_model ? *dst_model : src.Model();
  const Raster &raster = *src.GetRaster();

  std::shared_ptr<Raster> dst_raster;
  if (model.NumComponents() == raster.NumBands()) {
    dst_raster = raster.CreateCompatibleRaster();
  } else {
    auto layout = ComponentSampleLayout::Interleaved(
        raster.Layout()->Type(), raster.Width(), raster.Height(),
        model.NumComponents());
    dst_raster = Raster::Create(layout, raster.Bounds().Origin());
  }

  return std::make_shared<ColorImage>(model, dst_raster);
}
