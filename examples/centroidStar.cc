//
// Demonstrate use of the centroiders on a synthetic star
//
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "ndarray.h"
#include "lsst/meas/centroid.h"

using namespace std;
namespace centroid = lsst::meas::centroid;

namespace {

ndarray::Array<double, 2, 2> makeStar(int width, int height, double xc, double yc, double sigma) {
    ndarray::Array<double, 2, 2> image = ndarray::allocate(height, width);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            double const r2 = (x - xc) * (x - xc) + (y - yc) * (y - yc);
            image[y][x] = 10.0 + 1000.0 * std::exp(-0.5 * r2 / (sigma * sigma));
        }
    }
    return image;
}

}  // namespace

int main(int argc, char **argv) {
    string const name = (argc > 1) ? argv[1] : "2dg";
    shared_ptr<centroid::Centroider> cc = centroid::makeCentroider(name);

    ndarray::Array<double, 2, 2> image = makeStar(100, 80, 40.3, 33.8, 2.0);

    centroid::Result<lsst::geom::Point2D> cen = cc->apply(image);
    cout << name << ": (x, y) = " << cen.value.getX() << ", " << cen.value.getY() << endl;

    vector<double> xpos = {38.0};
    vector<double> ypos = {35.0};
    centroid::Result<centroid::SourceCentroids> sources =
            centroid::centroidSources(image, xpos, ypos, *cc);
    cout << name << " in an 11x11 box: (x, y) = " << sources.value.x[0] << ", " << sources.value.y[0] << endl;
}
