#include"../../include/Model/nnBase.hpp"

namespace TrustRegion
{
    NNBase::NNBase(unsigned int numInputs, unsigned int outputSize)
        : numInputs(numInputs),
          outputSize(outputSize)
    {
    }
}
