#include "primer/footprintCalibrator.hpp"
#include "primer/retentionSet.hpp"

#include <stdexcept>

FootprintCalibrator::FootprintCalibrator(HeapProbe& heap, std::int64_t reference_volume_bytes)
    : heap_(heap), volume_(reference_volume_bytes)
{
    if (volume_ <= 0)
        throw std::invalid_argument("FootprintCalibrator: reference volume must be positive");
}

std::int64_t FootprintCalibrator::batchCount(int shape_size, std::int64_t reference_volume_bytes)
{
    return reference_volume_bytes / (kRoughUnitOverhead + static_cast<std::int64_t>(shape_size) * kElementBytes);
}

double FootprintCalibrator::calibrateBytesPerUnit(int shape_size)
{
    if (shape_size <= 0)
        throw std::invalid_argument("FootprintCalibrator: shape size must be positive");

    const std::int64_t batch = batchCount(shape_size, volume_);
    lastBatch_ = batch;

    heap_.collect();
    const std::int64_t before = heap_.usedBytes();
    {
        Slab calibration;
        calibration.reserve(static_cast<std::size_t>(batch));
        for (std::int64_t i = 0; i < batch; ++i)
            calibration.push_back(allocateUnit(static_cast<std::size_t>(shape_size)));

        lastBytesUsed_ = heap_.usedBytes() - before;
    }
    heap_.collect();

    if (batch == 0)
        return 0.0;
    return static_cast<double>(lastBytesUsed_) / static_cast<double>(batch);
}
