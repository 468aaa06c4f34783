#ifndef _SEQ_TAGGER_CATALOG
#define _SEQ_TAGGER_CATALOG

#include <memory>
#include "models/sequence_tagger.hpp"
#include "utils/config.hpp"


namespace seqtag{
    namespace models{

// inputter and encoder variants selected by name, throws std::invalid_argument on unknown names
std::shared_ptr<inputters::inputter> make_inputter(const config::modelOptions& options);
std::shared_ptr<encoders::encoder> make_encoder(const config::modelOptions& options);

// a tagger ready to be initialized with the data configuration
std::shared_ptr<sequenceTagger> make_sequence_tagger(const config::modelOptions& options);

    } // namespace models
} // namespace seqtag


#endif // _SEQ_TAGGER_CATALOG
