// -*- lsst-c++ -*-
#if !defined(LSST_MEAS_CENTROID_H)
#define LSST_MEAS_CENTROID_H

#include "lsst/meas/centroid/Result.h"
#include "lsst/meas/centroid/Oversampling.h"
#include "lsst/meas/centroid/centroidCom.h"
#include "lsst/meas/centroid/gaussianCentroid.h"
#include "lsst/meas/centroid/epsfCentroid.h"
#include "lsst/meas/centroid/Centroider.h"
#include "lsst/meas/centroid/centroidSources.h"
#endif
